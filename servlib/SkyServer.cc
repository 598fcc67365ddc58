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

#include <oasys/io/FileUtils.h>
#include <oasys/tclcmd/TclCommand.h>

#include "SkyServer.h"
#include "bundling/BundleNode.h"
#include "cmd/BundleCommand.h"
#include "cmd/NeighborCommand.h"
#include "cmd/NodeCommand.h"
#include "cmd/ParamCommand.h"
#include "cmd/RouteCommand.h"
#include "cmd/ShutdownCommand.h"
#include "cmd/StorageCommand.h"
#include "cmd/TopologyCommand.h"
#include "contacts/TopologyManager.h"
#include "routing/BundleRouter.h"
#include "storage/BundleStore.h"
#include "storage/BundleStorageConfig.h"
#include "skydtn_errno.h"

namespace skydtn {

//----------------------------------------------------------------------
SkyServer::Params::Params()
    : node_id_("sat-1"),
      endpoint_("dtn://sat-1")
{}

SkyServer::Params SkyServer::params_;

//----------------------------------------------------------------------
SkyServer::SkyServer(const char* logpath,
                     BundleStorageConfig* storage_config)
    : Logger("SkyServer", "%s", logpath),
      storage_config_(storage_config),
      topology_(new TopologyManager()),
      node_(NULL)
{}

//----------------------------------------------------------------------
SkyServer::~SkyServer()
{
    shutdown();
    delete topology_;
    log_notice("daemon exiting...");
}

//----------------------------------------------------------------------
void
SkyServer::init()
{
    init_commands();
}

//----------------------------------------------------------------------
void
SkyServer::init_commands()
{
    oasys::TclCommandInterp* interp = oasys::TclCommandInterp::instance();

    interp->reg(new BundleCommand(this));
    interp->reg(new NeighborCommand(this));
    interp->reg(new NodeCommand(this));
    interp->reg(new ParamCommand());
    interp->reg(new RouteCommand(this));
    interp->reg(new ShutdownCommand(this, "shutdown"));
    interp->reg(new ShutdownCommand(this, "quit"));
    interp->reg(new StorageCommand(storage_config_));
    interp->reg(new TopologyCommand(this));

    log_debug("registered skydtn commands");
}

//----------------------------------------------------------------------
bool
SkyServer::parse_conf_file(std::string& conf_file,
                           bool         conf_file_set)
{
    static const char* default_conf[] = { "/etc/skydtn.conf",
                                          "daemon/skydtn.conf",
                                          NULL };

    if (conf_file.empty() && !conf_file_set) {
        for (int i = 0; default_conf[i] != NULL; ++i) {
            if (oasys::FileUtils::readable(default_conf[i], logpath())) {
                conf_file.assign(default_conf[i]);
                break;
            }
        }

        if (conf_file.empty()) {
            log_notice("no configuration file found, using built-in defaults");
            return true;
        }
    } else if (conf_file.empty()) {
        // -c "" explicitly disables the configuration file
        log_info("configuration file disabled, using built-in defaults");
        return true;
    } else if (!oasys::FileUtils::readable(conf_file.c_str(), logpath())) {
        log_err("configuration file \"%s\" not readable", conf_file.c_str());
        return false;
    }

    log_info("parsing configuration file %s...", conf_file.c_str());
    if (oasys::TclCommandInterp::instance()->exec_file(conf_file.c_str()) != 0) {
        log_err("error in configuration file %s", conf_file.c_str());
        return false;
    }

    return true;
}

//----------------------------------------------------------------------
BundleNode*
SkyServer::node()
{
    oasys::ScopeLock l(&lock_, "SkyServer::node");
    return node_;
}

//----------------------------------------------------------------------
int
SkyServer::start_node()
{
    oasys::ScopeLock l(&lock_, "SkyServer::start_node");

    if (node_ != NULL) {
        log_warn("start_node: node %s already started", node_->id().c_str());
        return SKYDTN_ESTATE;
    }

    if (params_.node_id_.empty() || params_.endpoint_.empty()) {
        log_err("start_node: node id and endpoint must be configured");
        return SKYDTN_EVALIDATION;
    }

    oasys::StaticStringBuffer<128> errbuf;
    if (BundleRouter::validate_config(&errbuf) != SKYDTN_SUCCESS) {
        log_crit("start_node: invalid router configuration: %s", errbuf.c_str());
        return SKYDTN_EVALIDATION;
    }

    BundleRouter* router = BundleRouter::create_router(BundleRouter::config_.type_.c_str());
    if (router == NULL) {
        log_crit("unknown router type %s", BundleRouter::config_.type_.c_str());
        return SKYDTN_EVALIDATION;
    }

    if (storage_config_->tidy_) {
        storage_config_->init_ = true; // init is implicit with tidy
    }

    BundleStore* store = NULL;
    int err = BundleStore::create_store(*storage_config_, &store);
    if (err != SKYDTN_SUCCESS) {
        log_crit("error creating %s bundle store: %s",
                 storage_config_->type_.c_str(), skydtn_strerror(err));
        delete router;
        return err;
    }

    node_ = new BundleNode(params_.node_id_, params_.endpoint_, store, router);

    err = node_->start();
    if (err != SKYDTN_SUCCESS) {
        log_crit("error starting node %s: %s",
                 params_.node_id_.c_str(), skydtn_strerror(err));
        delete node_;
        node_ = NULL;
        return err;
    }

    log_notice("node %s (%s) started", params_.node_id_.c_str(),
               params_.endpoint_.c_str());
    return SKYDTN_SUCCESS;
}

//----------------------------------------------------------------------
void
SkyServer::shutdown()
{
    BundleNode* node;
    {
        oasys::ScopeLock l(&lock_, "SkyServer::shutdown");
        node = node_;
        node_ = NULL;
    }

    if (node == NULL) {
        return;
    }

    log_info("SkyServer shutdown called, stopping node %s", node->id().c_str());

    // the node owns the store and router and releases them after
    // its workers are joined
    node->stop();
    delete node;
}

} // namespace skydtn
