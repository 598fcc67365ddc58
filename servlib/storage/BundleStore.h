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

#ifndef _BUNDLE_STORE_H_
#define _BUNDLE_STORE_H_

#include <string>

#include <oasys/debug/Logger.h>
#include <oasys/util/StringBuffer.h>

#include "BundleFilter.h"
#include "BundleStorageConfig.h"
#include "bundling/Bundle.h"
#include "bundling/BundleStatus.h"

namespace skydtn {

/**
 * Abstract contract for bundle storage. The store is the only holder
 * of authoritative custody status for each stored copy.
 *
 * Bundles cross the store boundary by value: store() keeps its own
 * copy and retrieve() and list() hand back copies, so a caller can
 * never alter stored state through a bundle it holds.
 *
 * Every operation on an id that is not present fails with
 * SKYDTN_ENOTFOUND. Mutations of a single id are serialized.
 */
class BundleStore : public oasys::Logger {
public:
    BundleStore(const char* classname, const char* logpath);
    virtual ~BundleStore();

    /**
     * Create and initialize the store selected by cfg.type_.
     *
     * @return SKYDTN_SUCCESS with the new store in *store, or an error
     */
    static int create_store(const BundleStorageConfig& cfg,
                            BundleStore**              store);

    /**
     * Keep a copy of the bundle with status pending. Invalid or
     * expired bundles and ids already present are rejected with
     * SKYDTN_EVALIDATION; SKYDTN_ECAPACITY if nothing can be evicted
     * to make room.
     */
    virtual int store(const Bundle& bundle) = 0;

    /// Copy the stored bundle into *bundle
    virtual int retrieve(const std::string& id, Bundle* bundle) = 0;

    /// Remove the bundle
    virtual int del(const std::string& id) = 0;

    /// Copies of every bundle that matches the filter
    virtual int list(const BundleFilter& filter, BundleList* bundles) = 0;

    /**
     * Change the custody status of a stored copy. An illegal
     * transition (e.g. out of a terminal state) is SKYDTN_EVALIDATION.
     */
    virtual int update_status(const std::string& id,
                              bundle_status_t status) = 0;

    /// Current custody status of a stored copy
    virtual int get_status(const std::string& id,
                           bundle_status_t* status) = 0;

    /// Number of stored bundles
    virtual size_t count() = 0;

    /// Summed Bundle::size() of stored bundles
    virtual u_int64_t total_bytes() = 0;

    /// Name of the implementation, for display
    virtual const char* type_str() const = 0;

    /**
     * Append a short summary to buf.
     */
    virtual void get_stats(oasys::StringBuffer* buf);
};

} // namespace skydtn

#endif /* _BUNDLE_STORE_H_ */
