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

#include <oasys/util/OptParser.h>
#include <oasys/util/StringBuffer.h>

#include "TopologyCommand.h"
#include "SkyServer.h"
#include "contacts/TopologyManager.h"
#include "skydtn_errno.h"

namespace skydtn {

static bool
parse_double(const char* str, double* val)
{
    char* end;
    *val = strtod(str, &end);
    return (end != str && *end == '\0');
}

TopologyCommand::TopologyCommand(SkyServer* server)
    : TclCommand("topology"),
      server_(server)
{
    bind_var(new oasys::DoubleOpt("max_range",
                                  &TopologyManager::params_.max_range_km_,
                                  "km",
                                  "Maximum distance at which two nodes can "
                                  "communicate (default 5000)"));

    bind_var(new oasys::DoubleOpt("low_battery_pct",
                                  &TopologyManager::params_.low_battery_pct_,
                                  "percent",
                                  "Battery level counted as low in the network "
                                  "statistics (default 20)"));

    add_to_help("update <id> <eid> <x> <y> <z> [vx=<v> vy=<v> vz=<v> "
                "battery=<pct> eclipse=<bool>]",
                "record a node's position, velocity and power state");
    add_to_help("remove <id>", "stop tracking a node");
    add_to_help("visible <id>", "list the nodes within range of a node");
    add_to_help("predict <id> <secs>", "extrapolate a node's position");
    add_to_help("distance <id1> <id2>", "distance in km between two nodes");
    add_to_help("stats", "print the network statistics");
    add_to_help("dump", "dump all tracked nodes");
}

int
TopologyCommand::exec(int argc, const char** argv, Tcl_Interp* interp)
{
    (void)interp;

    if (argc < 2) {
        wrong_num_args(argc, argv, 1, 2, INT_MAX);
        return TCL_ERROR;
    }

    TopologyManager* topology = server_->topology();
    const char* cmd = argv[1];

    if (strcmp(cmd, "update") == 0) {
        return process_update(argc, argv);
    }

    else if (strcmp(cmd, "remove") == 0) {
        if (argc != 3) {
            wrong_num_args(argc, argv, 2, 3, 3);
            return TCL_ERROR;
        }

        if (topology->remove_satellite(argv[2]) != SKYDTN_SUCCESS) {
            resultf("unknown node %s", argv[2]);
            return TCL_ERROR;
        }
        return TCL_OK;
    }

    else if (strcmp(cmd, "visible") == 0) {
        if (argc != 3) {
            wrong_num_args(argc, argv, 2, 3, 3);
            return TCL_ERROR;
        }

        SatelliteList visible;
        if (topology->get_visible_neighbors(argv[2], &visible) != SKYDTN_SUCCESS) {
            resultf("unknown node %s", argv[2]);
            return TCL_ERROR;
        }

        SatelliteList::const_iterator iter;
        for (iter = visible.begin(); iter != visible.end(); ++iter) {
            append_resultf("%s ", iter->id_.c_str());
        }
        return TCL_OK;
    }

    else if (strcmp(cmd, "predict") == 0) {
        if (argc != 4) {
            wrong_num_args(argc, argv, 2, 4, 4);
            return TCL_ERROR;
        }

        double dt;
        if (! parse_double(argv[3], &dt)) {
            resultf("invalid time offset %s", argv[3]);
            return TCL_ERROR;
        }

        Position pos;
        if (topology->predict_position(argv[2], dt, &pos) != SKYDTN_SUCCESS) {
            resultf("unknown node %s", argv[2]);
            return TCL_ERROR;
        }

        resultf("%.3f %.3f %.3f", pos.x_, pos.y_, pos.z_);
        return TCL_OK;
    }

    else if (strcmp(cmd, "distance") == 0) {
        if (argc != 4) {
            wrong_num_args(argc, argv, 2, 4, 4);
            return TCL_ERROR;
        }

        double d;
        if (topology->distance(argv[2], argv[3], &d) != SKYDTN_SUCCESS) {
            resultf("unknown node %s or %s", argv[2], argv[3]);
            return TCL_ERROR;
        }

        resultf("%.3f", d);
        return TCL_OK;
    }

    else if (strcmp(cmd, "stats") == 0) {
        TopologyManager::NetworkStatistics stats = topology->get_network_statistics();
        resultf("%zu nodes -- %zu low battery -- %zu in eclipse",
                stats.total_, stats.low_battery_count_, stats.eclipse_count_);
        return TCL_OK;
    }

    else if (strcmp(cmd, "dump") == 0) {
        oasys::StringBuffer buf;
        topology->dump(&buf);
        set_result(buf.c_str());
        return TCL_OK;
    }

    resultf("unknown topology subcommand %s", cmd);
    return TCL_ERROR;
}

int
TopologyCommand::process_update(int argc, const char** argv)
{
    // topology update <id> <eid> <x> <y> <z> [opts]
    if (argc < 7) {
        wrong_num_args(argc, argv, 2, 7, INT_MAX);
        return TCL_ERROR;
    }

    SatelliteState state;
    state.id_  = argv[2];
    state.eid_ = argv[3];

    if (! parse_double(argv[4], &state.position_.x_) ||
        ! parse_double(argv[5], &state.position_.y_) ||
        ! parse_double(argv[6], &state.position_.z_))
    {
        resultf("invalid position %s %s %s", argv[4], argv[5], argv[6]);
        return TCL_ERROR;
    }

    oasys::OptParser p;
    p.addopt(new oasys::DoubleOpt("vx",      &state.velocity_.x_));
    p.addopt(new oasys::DoubleOpt("vy",      &state.velocity_.y_));
    p.addopt(new oasys::DoubleOpt("vz",      &state.velocity_.z_));
    p.addopt(new oasys::DoubleOpt("battery", &state.battery_pct_));
    p.addopt(new oasys::BoolOpt("eclipse",   &state.in_eclipse_));

    for (int i = 7; i < argc; ++i) {
        if (! p.parse_opt(argv[i], strlen(argv[i]))) {
            resultf("invalid topology update option '%s'", argv[i]);
            return TCL_ERROR;
        }
    }

    server_->topology()->update_satellite(state);
    return TCL_OK;
}

} // namespace skydtn
