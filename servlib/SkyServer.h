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

#ifndef _SKYSERVER_H_
#define _SKYSERVER_H_

#include <string>

#include <oasys/debug/Logger.h>
#include <oasys/thread/SpinLock.h>

namespace skydtn {

class BundleNode;
class BundleStorageConfig;
class TopologyManager;

/**
 * Owner of the daemon components. The topology manager exists from
 * construction so that telemetry can be loaded by the configuration
 * file; the bundle store, router and node are built by start_node()
 * once the node identity and parameters have been configured.
 */
class SkyServer : public oasys::Logger {
public:
    SkyServer(const char* logpath, BundleStorageConfig* storage_config);

    ~SkyServer();

    /**
     * Node identity, bound to the "node" command.
     */
    struct Params {
        Params();

        std::string node_id_;
        std::string endpoint_;
    };

    static Params params_;

    /**
     * Register all the daemon commands with the Tcl interpreter.
     */
    void init();

    /**
     * Run the Tcl configuration file. Without one the built-in
     * defaults are kept. Returns false if the file is unreadable
     * or fails to evaluate.
     */
    bool parse_conf_file(std::string& conf_file,
                         bool         conf_file_set);

    /**
     * Build the bundle store, router and node from the current
     * configuration and start the node workers. Returns SKYDTN_ESTATE
     * if the node was already started.
     */
    int start_node();

    /**
     * Stop the node and tear down the components in reverse order of
     * construction. Safe to call more than once.
     */
    void shutdown();

    /// @{ Accessors
    BundleStorageConfig* storage_config() { return storage_config_; }
    TopologyManager*     topology()       { return topology_; }
    BundleNode*          node();
    /// @}

private:
    /// Initialize and register all the server related commands.
    void init_commands();

    BundleStorageConfig* storage_config_;
    TopologyManager*     topology_;
    BundleNode*          node_;
    oasys::SpinLock      lock_;
};

} // namespace skydtn

#endif /* _SKYSERVER_H_ */
