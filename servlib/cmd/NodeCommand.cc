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

#include <string.h>

#include <oasys/util/StringBuffer.h>

#include "NodeCommand.h"
#include "SkyServer.h"
#include "bundling/BundleNode.h"
#include "skydtn_errno.h"

namespace skydtn {

NodeCommand::NodeCommand(SkyServer* server)
    : TclCommand("node"),
      server_(server)
{
    bind_var(new oasys::StringOpt("id", &SkyServer::params_.node_id_,
                                  "id", "Identifier of the local node "
                                  "(default sat-1)"));

    bind_var(new oasys::StringOpt("endpoint", &SkyServer::params_.endpoint_,
                                  "eid", "Endpoint of the local node; bundles "
                                  "for it are delivered locally "
                                  "(default dtn://sat-1)"));

    add_to_help("start", "build the store and router and start the node");
    add_to_help("state", "print the node lifecycle state");
    add_to_help("stats", "print the node statistics");
}

int
NodeCommand::exec(int argc, const char** argv, Tcl_Interp* interp)
{
    (void)interp;

    if (argc != 2) {
        wrong_num_args(argc, argv, 1, 2, 2);
        return TCL_ERROR;
    }

    const char* cmd = argv[1];

    if (strcmp(cmd, "start") == 0) {
        int err = server_->start_node();
        if (err != SKYDTN_SUCCESS) {
            resultf("error starting node: %s", skydtn_strerror(err));
            return TCL_ERROR;
        }
        return TCL_OK;
    }

    BundleNode* node = server_->node();

    if (strcmp(cmd, "state") == 0) {
        if (node == NULL) {
            set_result("not started");
        } else {
            set_result(BundleNode::state_to_str(node->state()));
        }
        return TCL_OK;
    }

    else if (strcmp(cmd, "stats") == 0) {
        if (node == NULL) {
            resultf("node not started");
            return TCL_ERROR;
        }

        oasys::StringBuffer buf;
        node->get_daemon_stats(&buf);
        set_result(buf.c_str());
        return TCL_OK;
    }

    resultf("unknown node subcommand %s", cmd);
    return TCL_ERROR;
}

} // namespace skydtn
