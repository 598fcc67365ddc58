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

#include <limits.h>
#include <stdlib.h>
#include <string.h>

#include <oasys/util/StringBuffer.h>

#include "NeighborCommand.h"
#include "SkyServer.h"
#include "bundling/BundleNode.h"
#include "contacts/TopologyManager.h"
#include "skydtn_errno.h"

namespace skydtn {

static bool
parse_quality(const char* str, double* quality)
{
    char* end;
    *quality = strtod(str, &end);
    return (end != str && *end == '\0');
}

NeighborCommand::NeighborCommand(SkyServer* server)
    : TclCommand("neighbor"),
      server_(server)
{
    add_to_help("add <id> <eid> <quality>", "add or reactivate a neighbor");
    add_to_help("del <id>", "remove a neighbor");
    add_to_help("quality <id> <quality>", "update a neighbor's link quality");
    add_to_help("active <id> <true|false>", "mark a neighbor up or down");
    add_to_help("list", "list the neighbor table");
    add_to_help("refresh", "recompute the neighbors from the topology");
}

int
NeighborCommand::exec(int argc, const char** argv, Tcl_Interp* interp)
{
    (void)interp;

    if (argc < 2) {
        wrong_num_args(argc, argv, 1, 2, INT_MAX);
        return TCL_ERROR;
    }

    BundleNode* node = server_->node();
    if (node == NULL) {
        resultf("node not started");
        return TCL_ERROR;
    }

    const char* cmd = argv[1];

    if (strcmp(cmd, "add") == 0) {
        // neighbor add <id> <eid> <quality>
        if (argc != 5) {
            wrong_num_args(argc, argv, 2, 5, 5);
            return TCL_ERROR;
        }

        double quality;
        if (! parse_quality(argv[4], &quality)) {
            resultf("invalid link quality %s", argv[4]);
            return TCL_ERROR;
        }

        node->add_neighbor(argv[2], argv[3], quality);
        return TCL_OK;
    }

    else if (strcmp(cmd, "del") == 0) {
        // neighbor del <id>
        if (argc != 3) {
            wrong_num_args(argc, argv, 2, 3, 3);
            return TCL_ERROR;
        }

        if (node->remove_neighbor(argv[2]) != SKYDTN_SUCCESS) {
            resultf("no neighbor %s", argv[2]);
            return TCL_ERROR;
        }
        return TCL_OK;
    }

    else if (strcmp(cmd, "quality") == 0) {
        // neighbor quality <id> <quality>
        if (argc != 4) {
            wrong_num_args(argc, argv, 2, 4, 4);
            return TCL_ERROR;
        }

        double quality;
        if (! parse_quality(argv[3], &quality)) {
            resultf("invalid link quality %s", argv[3]);
            return TCL_ERROR;
        }

        if (node->update_neighbor_quality(argv[2], quality) != SKYDTN_SUCCESS) {
            resultf("no neighbor %s", argv[2]);
            return TCL_ERROR;
        }
        return TCL_OK;
    }

    else if (strcmp(cmd, "active") == 0) {
        // neighbor active <id> <true|false>
        if (argc != 4) {
            wrong_num_args(argc, argv, 2, 4, 4);
            return TCL_ERROR;
        }

        bool active;
        if (strcmp(argv[3], "true") == 0) {
            active = true;
        } else if (strcmp(argv[3], "false") == 0) {
            active = false;
        } else {
            resultf("expected true or false, got %s", argv[3]);
            return TCL_ERROR;
        }

        if (node->set_neighbor_active(argv[2], active) != SKYDTN_SUCCESS) {
            resultf("no neighbor %s", argv[2]);
            return TCL_ERROR;
        }
        return TCL_OK;
    }

    else if (strcmp(cmd, "list") == 0) {
        oasys::StringBuffer buf;
        node->neighbors().dump(&buf);
        set_result(buf.c_str());
        return TCL_OK;
    }

    else if (strcmp(cmd, "refresh") == 0) {
        int err = node->refresh_neighbors(*server_->topology());
        if (err != SKYDTN_SUCCESS) {
            resultf("error refreshing neighbors: %s", skydtn_strerror(err));
            return TCL_ERROR;
        }
        return TCL_OK;
    }

    resultf("unknown neighbor subcommand %s", cmd);
    return TCL_ERROR;
}

} // namespace skydtn
