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

#include <string>
#include <unistd.h>

#include <oasys/debug/Log.h>
#include <oasys/io/NetUtils.h>
#include <oasys/tclcmd/ConsoleCommand.h>
#include <oasys/tclcmd/TclCommand.h>
#include <oasys/thread/Thread.h>
#include <oasys/util/App.h>
#include <oasys/util/Getopt.h>

#include "servlib/SkyServer.h"
#include "bundling/BundleNode.h"
#include "storage/BundleStorageConfig.h"
#include "skydtn_errno.h"

namespace skydtn {

/**
 * The skydtn daemon: reads the Tcl configuration, runs one node and
 * serves the command console until shutdown.
 */
class SkyDTND : public oasys::App {
public:
    SkyDTND();
    int main(int argc, char* argv[]);

protected:
    // virtual from oasys::App
    void fill_options();

    /// Set up the interpreter and the server, and run the config
    void init_server();

    /// Start the node unless the configuration already did
    void start_node();

    /// Block in the Tcl event loop or the interactive console
    void serve();

    SkyServer*             server_;
    oasys::ConsoleCommand* console_;
    BundleStorageConfig    storage_config_;
    bool                   interactive_;
};

//----------------------------------------------------------------------
SkyDTND::SkyDTND()
    : App("SkyDTND", "skydtnd", SKYDTN_VERSION_STRING),
      server_(NULL),
      console_(new oasys::ConsoleCommand("skydtn% ")),
      storage_config_("storage", "memory", "skydtn", "/var/skydtn/db"),
      interactive_(false)
{
    loglevel_  = oasys::LOG_NOTICE;
    debugpath_ = "~/.skydtndebug";
}

//----------------------------------------------------------------------
void
SkyDTND::fill_options()
{
    fill_default_options(DAEMONIZE_OPT | CONF_FILE_OPT);

    opts_.addopt(new oasys::BoolOpt('t', "tidy", &storage_config_.tidy_,
                                    "wipe the bundle store at startup"));

    opts_.addopt(new oasys::BoolOpt(0, "init-db", &storage_config_.init_,
                                    "create the bundle store tables at startup"));

    opts_.addopt(new oasys::BoolOpt('i', "interactive", &interactive_,
                                    "read commands from stdin"));

    opts_.addopt(new oasys::InAddrOpt(0, "console-addr", &console_->addr_,
                                      "<addr>", "address of the tcp console"));

    opts_.addopt(new oasys::UInt16Opt(0, "console-port", &console_->port_,
                                      "<port>", "port of the tcp console "
                                      "(0, the default, disables it)"));
}

//----------------------------------------------------------------------
void
SkyDTND::init_server()
{
    if (oasys::TclCommandInterp::init(name_.c_str(), "/skydtn/tclcmd") != 0) {
        log_crit_p("/skydtnd", "tcl interpreter initialization failed");
        notify_and_exit(1);
    }

    // worker threads created while the configuration runs are held
    // until the whole daemon is set up
    oasys::Thread::activate_start_barrier();

    server_ = new SkyServer("/skydtnd", &storage_config_);
    server_->init();
    oasys::TclCommandInterp::instance()->reg(console_);

    if (! server_->parse_conf_file(conf_file_, conf_file_set_)) {
        log_crit_p("/skydtnd", "configuration failed, exiting");
        notify_and_exit(1);
    }
}

//----------------------------------------------------------------------
void
SkyDTND::start_node()
{
    if (server_->node() != NULL) {
        return;
    }

    int err = server_->start_node();
    if (err != SKYDTN_SUCCESS) {
        log_crit_p("/skydtnd", "cannot start node %s: %s",
                   SkyServer::params_.node_id_.c_str(), skydtn_strerror(err));
        notify_and_exit(1);
    }
}

//----------------------------------------------------------------------
void
SkyDTND::serve()
{
    oasys::TclCommandInterp* interp = oasys::TclCommandInterp::instance();

    if (console_->port_ != 0) {
        log_notice_p("/skydtnd", "console listening on %s:%d",
                     intoa(console_->addr_), console_->port_);
        interp->command_server(console_->prompt_.c_str(),
                               console_->addr_, console_->port_);
    }

    if (interactive_ && ! daemonize_) {
        interp->command_loop(console_->prompt_.c_str());
    } else {
        interp->event_loop();
    }
}

//----------------------------------------------------------------------
int
SkyDTND::main(int argc, char* argv[])
{
    init_app(argc, argv);

    log_notice_p("/skydtnd", "skydtnd %s (pid %d) starting",
                 SKYDTN_VERSION_STRING, getpid());

    init_server();
    start_node();

    if (daemonize_) {
        daemonizer_.notify_parent(0);
    }

    oasys::Thread::release_start_barrier();

    serve();

    log_notice_p("/skydtnd", "console closed, shutting down");

    oasys::TclCommandInterp::shutdown();
    server_->shutdown();
    delete server_;
    server_ = NULL;

    return 0;
}

} // namespace skydtn

int
main(int argc, char* argv[])
{
    skydtn::SkyDTND skydtnd;
    return skydtnd.main(argc, argv);
}
