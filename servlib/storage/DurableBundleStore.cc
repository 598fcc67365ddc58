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

#include <memory>

#include <oasys/debug/Log.h>
#include <oasys/serialize/TypeShims.h>

#include "DurableBundleStore.h"
#include "skydtn_errno.h"

namespace skydtn {

//----------------------------------------------------------------------
DurableBundleStore::DurableBundleStore(const BundleStorageConfig& cfg)
    : BundleStore("DurableBundleStore", "/skydtn/storage/durable"),
      cfg_(cfg),
      store_(NULL),
      bundles_(NULL),
      total_bytes_(0)
{
}

//----------------------------------------------------------------------
DurableBundleStore::~DurableBundleStore()
{
    delete bundles_;
    bundles_ = NULL;

    if (store_ != NULL) {
        delete store_;
        store_ = NULL;

        // the oasys store registers itself as a singleton; clear it so
        // that the store can be opened again in the same process
        oasys::DurableStore::force_set_instance(NULL);
    }
}

//----------------------------------------------------------------------
int
DurableBundleStore::init()
{
    oasys::ScopeLock l(&lock_, "DurableBundleStore::init");

    store_ = new oasys::DurableStore("/skydtn/storage/durable/ds");

    bool clean_shutdown = true;
    int err = store_->create_store(cfg_, &clean_shutdown);
    if (err != 0) {
        log_err("error creating %s durable store: %d",
                cfg_.type_.c_str(), err);
        return SKYDTN_EINTERNAL;
    }

    if (! clean_shutdown) {
        log_warn("durable store was not shut down cleanly");
    }

    err = store_->get_table(&bundles_, "bundles", oasys::DS_CREATE);
    if (err != oasys::DS_OK) {
        log_err("error opening bundle table: %d", err);
        return SKYDTN_EINTERNAL;
    }

    std::vector<StoredBundle*> records;
    err = load_all(&records);
    if (err != SKYDTN_SUCCESS) {
        return err;
    }

    total_bytes_ = 0;
    for (size_t i = 0; i < records.size(); ++i) {
        total_bytes_ += records[i]->bundle_.size();
        delete records[i];
    }

    log_info("opened %s bundle store with %zu bundles",
             cfg_.type_.c_str(), records.size());
    return SKYDTN_SUCCESS;
}

//----------------------------------------------------------------------
int
DurableBundleStore::get_record(const std::string& id, StoredBundle** stored)
{
    int err = bundles_->get(oasys::StringShim(id), stored);
    if (err == oasys::DS_NOTFOUND) {
        return SKYDTN_ENOTFOUND;
    } else if (err != oasys::DS_OK) {
        log_err("error reading bundle %s: %d", id.c_str(), err);
        return SKYDTN_EINTERNAL;
    }
    return SKYDTN_SUCCESS;
}

//----------------------------------------------------------------------
int
DurableBundleStore::load_all(std::vector<StoredBundle*>* records)
{
    std::unique_ptr<oasys::DurableIterator> iter(bundles_->itr());
    oasys::StringShim key;

    while (true) {
        int err = iter->next();
        if (err == oasys::DS_NOTFOUND) {
            break;
        } else if (err != oasys::DS_OK) {
            log_err("error iterating bundle table: %d", err);
            return SKYDTN_EINTERNAL;
        }

        if (iter->get_key(&key) != 0) {
            log_err("error reading bundle table key");
            return SKYDTN_EINTERNAL;
        }

        StoredBundle* stored = NULL;
        err = get_record(key.value(), &stored);
        if (err != SKYDTN_SUCCESS) {
            return err;
        }
        records->push_back(stored);
    }

    return SKYDTN_SUCCESS;
}

//----------------------------------------------------------------------
int
DurableBundleStore::store(const Bundle& bundle)
{
    oasys::StringBuffer errbuf;
    if (bundle.validate(&errbuf) != SKYDTN_SUCCESS) {
        log_debug("store: rejecting *%p: %s", &bundle, errbuf.c_str());
        return SKYDTN_EVALIDATION;
    }

    oasys::ScopeLock l(&lock_, "DurableBundleStore::store");

    if (cfg_.max_bundles_ != 0 && bundles_->size() >= cfg_.max_bundles_) {
        log_warn("store: full at %u bundles, rejecting *%p",
                 cfg_.max_bundles_, &bundle);
        return SKYDTN_ECAPACITY;
    }

    StoredBundle stored(bundle, BUNDLE_PENDING);
    int err = bundles_->put(oasys::StringShim(bundle.id()), &stored,
                            oasys::DS_CREATE | oasys::DS_EXCL);
    if (err == oasys::DS_EXISTS) {
        log_debug("store: bundle %s already stored", bundle.id().c_str());
        return SKYDTN_EVALIDATION;
    } else if (err != oasys::DS_OK) {
        log_err("store: error adding *%p: %d", &bundle, err);
        return SKYDTN_EINTERNAL;
    }

    total_bytes_ += bundle.size();
    log_debug("store: added *%p", &bundle);
    return SKYDTN_SUCCESS;
}

//----------------------------------------------------------------------
int
DurableBundleStore::retrieve(const std::string& id, Bundle* bundle)
{
    oasys::ScopeLock l(&lock_, "DurableBundleStore::retrieve");

    StoredBundle* stored = NULL;
    int err = get_record(id, &stored);
    if (err != SKYDTN_SUCCESS) {
        return err;
    }

    *bundle = stored->bundle_;
    delete stored;
    return SKYDTN_SUCCESS;
}

//----------------------------------------------------------------------
int
DurableBundleStore::del(const std::string& id)
{
    oasys::ScopeLock l(&lock_, "DurableBundleStore::del");

    StoredBundle* stored = NULL;
    int err = get_record(id, &stored);
    if (err != SKYDTN_SUCCESS) {
        return err;
    }
    size_t sz = stored->bundle_.size();
    delete stored;

    err = bundles_->del(oasys::StringShim(id));
    if (err == oasys::DS_NOTFOUND) {
        return SKYDTN_ENOTFOUND;
    } else if (err != oasys::DS_OK) {
        log_err("del: error removing bundle %s: %d", id.c_str(), err);
        return SKYDTN_EINTERNAL;
    }

    total_bytes_ -= sz;
    log_debug("del: removed bundle %s", id.c_str());
    return SKYDTN_SUCCESS;
}

//----------------------------------------------------------------------
int
DurableBundleStore::list(const BundleFilter& filter, BundleList* bundles)
{
    u_int64_t now = BundleTimestamp::get_current_time_millis();

    oasys::ScopeLock l(&lock_, "DurableBundleStore::list");

    std::vector<StoredBundle*> records;
    int err = load_all(&records);

    std::vector<const StoredBundle*> matched;
    if (err == SKYDTN_SUCCESS) {
        for (size_t i = 0; i < records.size(); ++i) {
            if (filter.matches(*records[i], now)) {
                matched.push_back(records[i]);
            }
        }

        filter.finish(&matched);

        bundles->clear();
        bundles->reserve(matched.size());
        for (size_t i = 0; i < matched.size(); ++i) {
            bundles->push_back(matched[i]->bundle_);
        }
    }

    for (size_t i = 0; i < records.size(); ++i) {
        delete records[i];
    }

    return err;
}

//----------------------------------------------------------------------
int
DurableBundleStore::update_status(const std::string& id, bundle_status_t status)
{
    oasys::ScopeLock l(&lock_, "DurableBundleStore::update_status");

    StoredBundle* record = NULL;
    int err = get_record(id, &record);
    if (err != SKYDTN_SUCCESS) {
        return err;
    }
    std::unique_ptr<StoredBundle> stored(record);

    bundle_status_t cur = stored->status_;
    if (cur == status) {
        return SKYDTN_SUCCESS;
    }

    if (! bundle_status_transition_ok(cur, status)) {
        log_warn("update_status: bundle %s cannot go from %s to %s",
                 id.c_str(), bundle_status_to_str(cur),
                 bundle_status_to_str(status));
        return SKYDTN_EVALIDATION;
    }

    stored->status_ = status;
    err = bundles_->put(oasys::StringShim(id), stored.get(), 0);
    if (err != oasys::DS_OK) {
        log_err("update_status: error updating bundle %s: %d", id.c_str(), err);
        return SKYDTN_EINTERNAL;
    }

    log_debug("update_status: bundle %s %s -> %s", id.c_str(),
              bundle_status_to_str(cur), bundle_status_to_str(status));
    return SKYDTN_SUCCESS;
}

//----------------------------------------------------------------------
int
DurableBundleStore::get_status(const std::string& id, bundle_status_t* status)
{
    oasys::ScopeLock l(&lock_, "DurableBundleStore::get_status");

    StoredBundle* stored = NULL;
    int err = get_record(id, &stored);
    if (err != SKYDTN_SUCCESS) {
        return err;
    }

    *status = stored->status_;
    delete stored;
    return SKYDTN_SUCCESS;
}

//----------------------------------------------------------------------
size_t
DurableBundleStore::count()
{
    oasys::ScopeLock l(&lock_, "DurableBundleStore::count");
    return bundles_->size();
}

//----------------------------------------------------------------------
u_int64_t
DurableBundleStore::total_bytes()
{
    oasys::ScopeLock l(&lock_, "DurableBundleStore::total_bytes");
    return total_bytes_;
}

//----------------------------------------------------------------------
void
DurableBundleStore::get_stats(oasys::StringBuffer* buf)
{
    BundleStore::get_stats(buf);
    buf->appendf(" on %s (%s/%s)", cfg_.type_.c_str(),
                 cfg_.dbdir_.c_str(), cfg_.dbname_.c_str());
}

} // namespace skydtn
