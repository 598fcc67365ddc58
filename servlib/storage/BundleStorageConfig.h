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

#ifndef _BUNDLE_STORAGE_CONFIG_H_
#define _BUNDLE_STORAGE_CONFIG_H_

#include <oasys/storage/StorageConfig.h>

namespace skydtn {

/**
 * Subclass of the basic oasys storage config to add the bundle store
 * specific configuration variables.
 *
 * A type of "memory" selects the in-memory store; any oasys durable
 * store type (memorydb, filesysdb, berkeleydb) selects the persistent
 * store on that back end.
 */
class BundleStorageConfig : public oasys::StorageConfig {
public:
    BundleStorageConfig(
        const std::string& cmd,
        const std::string& type,
        const std::string& dbname,
        const std::string& dbdir)
        : StorageConfig(cmd, type, dbname, dbdir),
          max_bundles_(10000)
    {}

    /// Maximum number of bundles held before eviction kicks in
    /// (0 for no limit)
    u_int max_bundles_;
};

} // namespace skydtn

#endif /* _BUNDLE_STORAGE_CONFIG_H_ */
