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

#include <oasys/debug/Log.h>

#include "BundleStore.h"
#include "DurableBundleStore.h"
#include "MemoryBundleStore.h"
#include "skydtn_errno.h"

namespace skydtn {

//----------------------------------------------------------------------
BundleStore::BundleStore(const char* classname, const char* logpath)
    : Logger(classname, "%s", logpath)
{
}

//----------------------------------------------------------------------
BundleStore::~BundleStore()
{
}

//----------------------------------------------------------------------
int
BundleStore::create_store(const BundleStorageConfig& cfg,
                          BundleStore**              store)
{
    if (cfg.type_ == "memory") {
        *store = new MemoryBundleStore(cfg.max_bundles_);
        return SKYDTN_SUCCESS;
    }

    DurableBundleStore* durable = new DurableBundleStore(cfg);
    int err = durable->init();
    if (err != SKYDTN_SUCCESS) {
        log_err_p("/skydtn/storage",
                  "error initializing %s bundle store in %s: %s",
                  cfg.type_.c_str(), cfg.dbdir_.c_str(),
                  skydtn_strerror(err));
        delete durable;
        return err;
    }

    *store = durable;
    return SKYDTN_SUCCESS;
}

//----------------------------------------------------------------------
void
BundleStore::get_stats(oasys::StringBuffer* buf)
{
    buf->appendf("%s store: %zu bundles (%" PRIu64 " bytes)",
                 type_str(), count(), total_bytes());
}

} // namespace skydtn
