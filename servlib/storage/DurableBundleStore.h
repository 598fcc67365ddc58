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

#ifndef _DURABLE_BUNDLE_STORE_H_
#define _DURABLE_BUNDLE_STORE_H_

#include <oasys/storage/DurableStore.h>
#include <oasys/thread/SpinLock.h>

#include "BundleStore.h"
#include "StoredBundle.h"

namespace skydtn {

/**
 * BundleStore kept in an oasys durable store, one StoredBundle record
 * per bundle in a single table keyed by the bundle id. Any back end
 * oasys supports (memorydb, filesysdb, berkeleydb) can hold the table.
 *
 * Records left from a previous run are picked up by init().
 */
class DurableBundleStore : public BundleStore {
public:
    typedef oasys::SingleTypeDurableTable<StoredBundle> BundleTable;

    DurableBundleStore(const BundleStorageConfig& cfg);
    virtual ~DurableBundleStore();

    /**
     * Open the durable store and the bundle table.
     */
    int init();

    /// @{ Virtual from BundleStore
    int store(const Bundle& bundle);
    int retrieve(const std::string& id, Bundle* bundle);
    int del(const std::string& id);
    int list(const BundleFilter& filter, BundleList* bundles);
    int update_status(const std::string& id, bundle_status_t status);
    int get_status(const std::string& id, bundle_status_t* status);
    size_t count();
    u_int64_t total_bytes();
    const char* type_str() const { return "durable"; }
    void get_stats(oasys::StringBuffer* buf);
    /// @}

protected:
    /// Read one record; lock held
    int get_record(const std::string& id, StoredBundle** stored);

    /// Read every record; lock held
    int load_all(std::vector<StoredBundle*>* records);

    BundleStorageConfig     cfg_;
    oasys::DurableStore*    store_;
    BundleTable*            bundles_;
    u_int64_t               total_bytes_;
    mutable oasys::SpinLock lock_;
};

} // namespace skydtn

#endif /* _DURABLE_BUNDLE_STORE_H_ */
