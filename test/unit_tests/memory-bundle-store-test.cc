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

#include <unistd.h>

#include <oasys/thread/Thread.h>
#include <oasys/util/UnitTest.h>

#include "bundling/Bundle.h"
#include "storage/BundleFilter.h"
#include "storage/MemoryBundleStore.h"
#include "skydtn_errno.h"

using namespace oasys;
using namespace skydtn;

DECLARE_TEST(StoreRetrieve) {
    MemoryBundleStore store;
    Bundle b = Bundle::create("dtn://a", "dtn://b", "ping");

    CHECK_EQUAL(store.store(b), SKYDTN_SUCCESS);
    CHECK_EQUAL(store.count(), 1);
    CHECK_EQUAL_U64(store.total_bytes(), b.size());

    Bundle copy;
    CHECK_EQUAL(store.retrieve(b.id(), &copy), SKYDTN_SUCCESS);
    CHECK(copy.same_contents(b));

    // mutating the retrieved copy leaves the stored one alone
    copy.increment_hop("n1");

    Bundle again;
    CHECK_EQUAL(store.retrieve(b.id(), &again), SKYDTN_SUCCESS);
    CHECK_EQUAL(again.hop_count(), 0);
    CHECK(again.same_contents(b));

    bundle_status_t status;
    CHECK_EQUAL(store.get_status(b.id(), &status), SKYDTN_SUCCESS);
    CHECK_EQUAL(status, BUNDLE_PENDING);

    CHECK_EQUAL(store.retrieve("nope", &copy), SKYDTN_ENOTFOUND);

    return UNIT_TEST_PASSED;
}

DECLARE_TEST(RejectInvalid) {
    MemoryBundleStore store;

    CHECK_EQUAL(store.store(Bundle::create("", "dtn://b", "x")),
                SKYDTN_EVALIDATION);

    Bundle expired = Bundle::create("dtn://a", "dtn://b", "x", 1);
    usleep(20000);
    CHECK_EQUAL(store.store(expired), SKYDTN_EVALIDATION);

    Bundle b = Bundle::create("dtn://a", "dtn://b", "x");
    CHECK_EQUAL(store.store(b), SKYDTN_SUCCESS);
    CHECK_EQUAL(store.store(b), SKYDTN_EVALIDATION);
    CHECK_EQUAL(store.count(), 1);

    return UNIT_TEST_PASSED;
}

DECLARE_TEST(DeleteTwice) {
    MemoryBundleStore store;
    Bundle b = Bundle::create("dtn://a", "dtn://b", "x");

    CHECK_EQUAL(store.store(b), SKYDTN_SUCCESS);
    CHECK_EQUAL(store.del(b.id()), SKYDTN_SUCCESS);
    CHECK_EQUAL(store.del(b.id()), SKYDTN_ENOTFOUND);
    CHECK_EQUAL(store.count(), 0);
    CHECK_EQUAL_U64(store.total_bytes(), 0);

    return UNIT_TEST_PASSED;
}

DECLARE_TEST(UpdateStatus) {
    MemoryBundleStore store;
    Bundle b = Bundle::create("dtn://a", "dtn://b", "x");
    bundle_status_t status;

    CHECK_EQUAL(store.update_status(b.id(), BUNDLE_IN_TRANSIT), SKYDTN_ENOTFOUND);
    CHECK_EQUAL(store.store(b), SKYDTN_SUCCESS);

    CHECK_EQUAL(store.update_status(b.id(), BUNDLE_IN_TRANSIT), SKYDTN_SUCCESS);
    CHECK_EQUAL(store.update_status(b.id(), BUNDLE_IN_TRANSIT), SKYDTN_SUCCESS);
    CHECK_EQUAL(store.get_status(b.id(), &status), SKYDTN_SUCCESS);
    CHECK_EQUAL(status, BUNDLE_IN_TRANSIT);

    CHECK_EQUAL(store.update_status(b.id(), BUNDLE_DELIVERED), SKYDTN_SUCCESS);
    CHECK_EQUAL(store.update_status(b.id(), BUNDLE_DELIVERED), SKYDTN_SUCCESS);

    // terminal states are final
    CHECK_EQUAL(store.update_status(b.id(), BUNDLE_PENDING), SKYDTN_EVALIDATION);
    CHECK_EQUAL(store.get_status(b.id(), &status), SKYDTN_SUCCESS);
    CHECK_EQUAL(status, BUNDLE_DELIVERED);

    return UNIT_TEST_PASSED;
}

DECLARE_TEST(ListFilter) {
    MemoryBundleStore store;

    Bundle b1 = Bundle::create("dtn://a", "dtn://b", "1");
    Bundle b2 = Bundle::create("dtn://a", "dtn://c", "22");
    Bundle b3 = Bundle::create("dtn://x", "dtn://b", "333");
    b2.set_priority(Bundle::COS_EXPEDITED);
    b3.set_priority(Bundle::COS_BULK);

    CHECK_EQUAL(store.store(b1), SKYDTN_SUCCESS);
    CHECK_EQUAL(store.store(b2), SKYDTN_SUCCESS);
    CHECK_EQUAL(store.store(b3), SKYDTN_SUCCESS);
    CHECK_EQUAL(store.update_status(b1.id(), BUNDLE_IN_TRANSIT), SKYDTN_SUCCESS);

    BundleList l;

    DO(store.list(BundleFilter(), &l));
    CHECK_EQUAL(l.size(), 3);

    BundleFilter by_dest;
    by_dest.set_dest("dtn://b");
    DO(store.list(by_dest, &l));
    CHECK_EQUAL(l.size(), 2);

    BundleFilter by_status;
    by_status.set_status(BUNDLE_PENDING);
    DO(store.list(by_status, &l));
    CHECK_EQUAL(l.size(), 2);

    BundleFilter conj;
    conj.set_dest("dtn://b").set_status(BUNDLE_PENDING);
    DO(store.list(conj, &l));
    CHECK_EQUAL(l.size(), 1);
    CHECK_EQUALSTR(l[0].id(), b3.id());

    BundleFilter by_prio;
    by_prio.set_min_priority(Bundle::COS_NORMAL);
    DO(store.list(by_prio, &l));
    CHECK_EQUAL(l.size(), 2);

    BundleFilter ordered;
    ordered.set_order(BundleFilter::ORDER_PRIORITY);
    DO(store.list(ordered, &l));
    CHECK_EQUAL(l.size(), 3);
    CHECK_EQUALSTR(l[0].id(), b2.id());
    CHECK_EQUALSTR(l[2].id(), b3.id());

    BundleFilter limited;
    limited.set_limit(2);
    DO(store.list(limited, &l));
    CHECK_EQUAL(l.size(), 2);

    BundleFilter by_size;
    by_size.set_order(BundleFilter::ORDER_SIZE).set_limit(1);
    DO(store.list(by_size, &l));
    CHECK_EQUAL(l.size(), 1);

    return UNIT_TEST_PASSED;
}

DECLARE_TEST(Eviction) {
    MemoryBundleStore store(2);

    Bundle low  = Bundle::create("dtn://a", "dtn://b", "low");
    Bundle mid  = Bundle::create("dtn://a", "dtn://b", "mid");
    Bundle high = Bundle::create("dtn://a", "dtn://b", "high");
    Bundle bulk = Bundle::create("dtn://a", "dtn://b", "bulk");
    low.set_priority(Bundle::COS_BULK);
    high.set_priority(Bundle::COS_EXPEDITED);
    bulk.set_priority(Bundle::COS_BULK);

    CHECK_EQUAL(store.store(low), SKYDTN_SUCCESS);
    CHECK_EQUAL(store.store(mid), SKYDTN_SUCCESS);

    // the bulk bundle makes way for an expedited one
    CHECK_EQUAL(store.store(high), SKYDTN_SUCCESS);
    CHECK_EQUAL(store.count(), 2);
    CHECK_EQUAL_U64(store.evicted(), 1);

    Bundle tmp;
    CHECK_EQUAL(store.retrieve(low.id(), &tmp), SKYDTN_ENOTFOUND);

    // nothing of lower or equal priority left for a bulk arrival
    CHECK_EQUAL(store.store(bulk), SKYDTN_ECAPACITY);

    // terminal copies are evicted before live ones
    CHECK_EQUAL(store.update_status(high.id(), BUNDLE_DELIVERED), SKYDTN_SUCCESS);
    CHECK_EQUAL(store.store(bulk), SKYDTN_SUCCESS);
    CHECK_EQUAL(store.retrieve(high.id(), &tmp), SKYDTN_ENOTFOUND);
    CHECK_EQUAL(store.retrieve(mid.id(), &tmp), SKYDTN_SUCCESS);

    return UNIT_TEST_PASSED;
}

/**
 * Races one status change (through in-transit to a terminal target)
 * and one delete against the other racers on the same bundle id.
 */
class Racer : public Thread {
public:
    Racer(BundleStore* store, const std::string& id, bundle_status_t target)
        : Thread("Racer", CREATE_JOINABLE),
          store_(store), id_(id), target_(target),
          transit_err_(-1), terminal_err_(-1), del_err_(-1), go_(false) {}

    BundleStore*    store_;
    std::string     id_;
    bundle_status_t target_;
    int             transit_err_;
    int             terminal_err_;
    int             del_err_;
    volatile bool   go_;

protected:
    void run() {
        while (! go_) {
            yield();
        }
        transit_err_  = store_->update_status(id_, BUNDLE_IN_TRANSIT);
        terminal_err_ = store_->update_status(id_, target_);
    }
};

class Deleter : public Thread {
public:
    Deleter(BundleStore* store, const std::string& id)
        : Thread("Deleter", CREATE_JOINABLE),
          store_(store), id_(id), err_(-1) {}

    BundleStore* store_;
    std::string  id_;
    int          err_;

protected:
    void run() {
        err_ = store_->del(id_);
    }
};

DECLARE_TEST(ConcurrentSameId) {
    static const int NRACERS = 8;

    MemoryBundleStore store;
    Bundle b = Bundle::create("dtn://a", "dtn://b", "contended");
    CHECK_EQUAL(store.store(b), SKYDTN_SUCCESS);

    Racer* racers[NRACERS];
    for (int i = 0; i < NRACERS; ++i) {
        racers[i] = new Racer(&store, b.id(),
                              (i % 2 == 0) ? BUNDLE_DELIVERED : BUNDLE_FAILED);
        racers[i]->start();
    }
    for (int i = 0; i < NRACERS; ++i) {
        racers[i]->go_ = true;
    }
    for (int i = 0; i < NRACERS; ++i) {
        racers[i]->join();
    }

    bundle_status_t final_status;
    CHECK_EQUAL(store.get_status(b.id(), &final_status), SKYDTN_SUCCESS);
    CHECK(bundle_status_is_terminal(final_status));

    // every terminal update that was accepted agrees with the final
    // status: no update was lost to a concurrent one
    int accepted = 0;
    for (int i = 0; i < NRACERS; ++i) {
        CHECK(racers[i]->transit_err_ == SKYDTN_SUCCESS ||
              racers[i]->transit_err_ == SKYDTN_EVALIDATION);
        if (racers[i]->terminal_err_ == SKYDTN_SUCCESS) {
            CHECK_EQUAL(racers[i]->target_, final_status);
            ++accepted;
        } else {
            CHECK_EQUAL(racers[i]->terminal_err_, SKYDTN_EVALIDATION);
        }
        delete racers[i];
    }
    CHECK(accepted >= 1);

    // exactly one of the racing deletes removes the bundle
    Deleter* deleters[NRACERS];
    for (int i = 0; i < NRACERS; ++i) {
        deleters[i] = new Deleter(&store, b.id());
        deleters[i]->start();
    }

    int removed = 0;
    for (int i = 0; i < NRACERS; ++i) {
        deleters[i]->join();
        if (deleters[i]->err_ == SKYDTN_SUCCESS) {
            ++removed;
        } else {
            CHECK_EQUAL(deleters[i]->err_, SKYDTN_ENOTFOUND);
        }
        delete deleters[i];
    }
    CHECK_EQUAL(removed, 1);
    CHECK_EQUAL(store.count(), 0);
    CHECK_EQUAL(store.update_status(b.id(), BUNDLE_DELIVERED), SKYDTN_ENOTFOUND);

    return UNIT_TEST_PASSED;
}

DECLARE_TESTER(MemoryBundleStoreTester) {
    ADD_TEST(StoreRetrieve);
    ADD_TEST(RejectInvalid);
    ADD_TEST(DeleteTwice);
    ADD_TEST(UpdateStatus);
    ADD_TEST(ListFilter);
    ADD_TEST(Eviction);
    ADD_TEST(ConcurrentSameId);
}

DECLARE_TEST_FILE(MemoryBundleStoreTester, "memory bundle store test");
