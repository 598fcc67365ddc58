/*
 *    Copyright 2015 United States Government as represented by NASA
 *       Marshall Space Flight Center. All Rights Reserved.
 *
 *    Released under the NASA Open Source Software Agreement version 1.3;
 *    You may obtain a copy of the Agreement at:
 * 
 *        http://ti.arc.nasa.gov/opensource/nosa/
 * 
 *    The subject software is provided "AS IS" WITHOUT ANY WARRANTY of any kind,
 *    either expressed, implied or statutory and this agreement does not,
 *    in any manner, constitute an endorsement by government agency of any
 *    results, designs or products resulting from use of the subject software.
 *    See the Agreement for the specific language governing permissions and
 *    limitations.
 */

#ifdef HAVE_CONFIG_H
#  include <skydtn-config.h>
#endif

#include <stdlib.h>

#include <oasys/util/StringBuffer.h>
#include <oasys/util/UnitTest.h>

#include "bundling/Bundle.h"
#include "storage/BundleFilter.h"
#include "storage/BundleStorageConfig.h"
#include "storage/DurableBundleStore.h"
#include "skydtn_errno.h"

using namespace oasys;
using namespace skydtn;

const char* g_db_dir = "output/durable-bundle-store-test";

BundleStorageConfig
memorydb_config()
{
    BundleStorageConfig cfg("storage", "memorydb", "", "");
    cfg.init_             = true;
    cfg.leave_clean_file_ = false;
    return cfg;
}

BundleStorageConfig
filesysdb_config(bool tidy)
{
    BundleStorageConfig cfg("storage", "filesysdb", "skydtn-test", g_db_dir);
    cfg.init_             = true;
    cfg.tidy_             = tidy;
    cfg.tidy_wait_        = 0;
    cfg.leave_clean_file_ = false;
    return cfg;
}

DECLARE_TEST(CreateStore) {
    BundleStorageConfig cfg = memorydb_config();

    BundleStore* store = NULL;
    CHECK_EQUAL(BundleStore::create_store(cfg, &store), SKYDTN_SUCCESS);
    CHECK(store != NULL);
    CHECK_EQUALSTR(store->type_str(), "durable");
    delete store;

    cfg.type_ = "memory";
    CHECK_EQUAL(BundleStore::create_store(cfg, &store), SKYDTN_SUCCESS);
    CHECK_EQUALSTR(store->type_str(), "memory");
    delete store;

    return UNIT_TEST_PASSED;
}

DECLARE_TEST(StoreRetrieveDelete) {
    DurableBundleStore store(memorydb_config());
    CHECK_EQUAL(store.init(), SKYDTN_SUCCESS);

    Bundle b = Bundle::create("dtn://a", "dtn://b", "ping");
    b.set_priority(Bundle::COS_EXPEDITED);

    CHECK_EQUAL(store.store(b), SKYDTN_SUCCESS);
    CHECK_EQUAL(store.store(b), SKYDTN_EVALIDATION);
    CHECK_EQUAL(store.count(), 1);
    CHECK_EQUAL_U64(store.total_bytes(), b.size());

    Bundle copy;
    CHECK_EQUAL(store.retrieve(b.id(), &copy), SKYDTN_SUCCESS);
    CHECK(copy.same_contents(b));

    bundle_status_t status;
    CHECK_EQUAL(store.get_status(b.id(), &status), SKYDTN_SUCCESS);
    CHECK_EQUAL(status, BUNDLE_PENDING);

    CHECK_EQUAL(store.update_status(b.id(), BUNDLE_IN_TRANSIT), SKYDTN_SUCCESS);
    CHECK_EQUAL(store.update_status(b.id(), BUNDLE_FAILED), SKYDTN_SUCCESS);
    CHECK_EQUAL(store.update_status(b.id(), BUNDLE_PENDING), SKYDTN_EVALIDATION);
    CHECK_EQUAL(store.get_status(b.id(), &status), SKYDTN_SUCCESS);
    CHECK_EQUAL(status, BUNDLE_FAILED);

    CHECK_EQUAL(store.del(b.id()), SKYDTN_SUCCESS);
    CHECK_EQUAL(store.del(b.id()), SKYDTN_ENOTFOUND);
    CHECK_EQUAL(store.retrieve(b.id(), &copy), SKYDTN_ENOTFOUND);
    CHECK_EQUAL(store.update_status(b.id(), BUNDLE_PENDING), SKYDTN_ENOTFOUND);
    CHECK_EQUAL(store.count(), 0);

    return UNIT_TEST_PASSED;
}

DECLARE_TEST(ListAndCapacity) {
    BundleStorageConfig cfg = memorydb_config();
    cfg.max_bundles_ = 3;

    DurableBundleStore store(cfg);
    CHECK_EQUAL(store.init(), SKYDTN_SUCCESS);

    Bundle b1 = Bundle::create("dtn://a", "dtn://b", "1");
    Bundle b2 = Bundle::create("dtn://a", "dtn://c", "2");
    Bundle b3 = Bundle::create("dtn://a", "dtn://b", "3");
    b3.set_priority(Bundle::COS_EXPEDITED);

    CHECK_EQUAL(store.store(b1), SKYDTN_SUCCESS);
    CHECK_EQUAL(store.store(b2), SKYDTN_SUCCESS);
    CHECK_EQUAL(store.store(b3), SKYDTN_SUCCESS);
    CHECK_EQUAL(store.store(Bundle::create("dtn://a", "dtn://b", "4")),
                SKYDTN_ECAPACITY);

    BundleList l;
    BundleFilter filter;
    filter.set_dest("dtn://b").set_order(BundleFilter::ORDER_PRIORITY);
    CHECK_EQUAL(store.list(filter, &l), SKYDTN_SUCCESS);
    CHECK_EQUAL(l.size(), 2);
    CHECK_EQUALSTR(l[0].id(), b3.id());
    CHECK_EQUALSTR(l[1].id(), b1.id());

    filter.set_limit(1);
    CHECK_EQUAL(store.list(filter, &l), SKYDTN_SUCCESS);
    CHECK_EQUAL(l.size(), 1);

    return UNIT_TEST_PASSED;
}

DECLARE_TEST(Reopen) {
    StringBuffer cmd("mkdir -p %s", g_db_dir);
    CHECK(system(cmd.c_str()) == 0);

    Bundle b = Bundle::create("dtn://a", "dtn://b", "survives a restart");

    {
        DurableBundleStore store(filesysdb_config(true));
        CHECK_EQUAL(store.init(), SKYDTN_SUCCESS);
        CHECK_EQUAL(store.store(b), SKYDTN_SUCCESS);
        CHECK_EQUAL(store.update_status(b.id(), BUNDLE_IN_TRANSIT), SKYDTN_SUCCESS);
    }

    {
        DurableBundleStore store(filesysdb_config(false));
        CHECK_EQUAL(store.init(), SKYDTN_SUCCESS);
        CHECK_EQUAL(store.count(), 1);
        CHECK_EQUAL_U64(store.total_bytes(), b.size());

        Bundle copy;
        CHECK_EQUAL(store.retrieve(b.id(), &copy), SKYDTN_SUCCESS);
        CHECK(copy.same_contents(b));

        bundle_status_t status;
        CHECK_EQUAL(store.get_status(b.id(), &status), SKYDTN_SUCCESS);
        CHECK_EQUAL(status, BUNDLE_IN_TRANSIT);
    }

    return UNIT_TEST_PASSED;
}

DECLARE_TESTER(DurableBundleStoreTester) {
    ADD_TEST(CreateStore);
    ADD_TEST(StoreRetrieveDelete);
    ADD_TEST(ListAndCapacity);
    ADD_TEST(Reopen);
}

DECLARE_TEST_FILE(DurableBundleStoreTester, "durable bundle store test");
