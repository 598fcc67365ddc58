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

#ifndef _MEMORY_BUNDLE_STORE_H_
#define _MEMORY_BUNDLE_STORE_H_

#include <map>

#include <oasys/thread/SpinLock.h>

#include "BundleStore.h"
#include "StoredBundle.h"

namespace skydtn {

/**
 * BundleStore kept entirely in memory.
 *
 * When the store holds max_bundles copies, room for a new one is made
 * by evicting expired copies, then copies in a terminal status, and
 * finally the oldest copy of the lowest priority, provided that
 * priority is not above the new bundle's.
 */
class MemoryBundleStore : public BundleStore {
public:
    MemoryBundleStore(u_int max_bundles = 10000);
    virtual ~MemoryBundleStore();

    /// @{ Virtual from BundleStore
    int store(const Bundle& bundle);
    int retrieve(const std::string& id, Bundle* bundle);
    int del(const std::string& id);
    int list(const BundleFilter& filter, BundleList* bundles);
    int update_status(const std::string& id, bundle_status_t status);
    int get_status(const std::string& id, bundle_status_t* status);
    size_t count();
    u_int64_t total_bytes();
    const char* type_str() const { return "memory"; }
    /// @}

    /**
     * Number of copies evicted to make room since startup.
     */
    u_int64_t evicted() const { return evicted_; }

protected:
    typedef std::map<std::string, StoredBundle> StoredMap;

    /// Make room for one more bundle of the given priority; lock held
    bool make_room(u_int8_t priority);

    /// Erase one entry and adjust the byte count; lock held
    void erase(StoredMap::iterator iter);

    u_int                   max_bundles_;
    StoredMap               bundles_;
    u_int64_t               total_bytes_;
    u_int64_t               evicted_;
    mutable oasys::SpinLock lock_;
};

} // namespace skydtn

#endif /* _MEMORY_BUNDLE_STORE_H_ */
