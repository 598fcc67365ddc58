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

#include <stdlib.h>
#include <string.h>

#include <oasys/util/StringBuffer.h>

#include "RouteCommand.h"
#include "SkyServer.h"
#include "bundling/BundleNode.h"
#include "routing/BundleRouter.h"
#include "routing/StaticBundleRouter.h"
#include "skydtn_errno.h"

namespace skydtn {

RouteCommand::RouteCommand(SkyServer* server)
    : TclCommand("route"),
      server_(server)
{
    bind_var(new oasys::StringOpt("type", &BundleRouter::config_.type_,
                                  "type", "Which routing algorithm to use "
				"(default energy).\n"
		"	valid options:\n"
		"			energy\n"
		"			static"));

    bind_var(new oasys::DoubleOpt("quality_weight",
                                  &BundleRouter::config_.quality_weight_,
				"weight",
				"Weight of the link quality in the energy "
				"router score (default 0.7)"));

    bind_var(new oasys::DoubleOpt("energy_weight",
                                  &BundleRouter::config_.energy_weight_,
				"weight",
				"Weight of the energy score in the energy "
				"router score (default 0.3)"));

    bind_var(new oasys::DoubleOpt("low_quality_threshold",
                                  &BundleRouter::config_.low_quality_threshold_,
				"quality",
				"Link quality under which a neighbor's energy "
				"score is penalized (default 0.3)"));

    bind_var(new oasys::DoubleOpt("penalized_energy_score",
                                  &BundleRouter::config_.penalized_energy_score_,
				"score",
				"Energy score given to penalized neighbors "
				"(default 0.3)"));

    bind_var(new oasys::DoubleOpt("low_battery_pct",
                                  &BundleRouter::config_.low_battery_pct_,
				"percent",
				"Battery level under which a neighbor's energy "
				"score is penalized (default 20)"));

    add_to_help("add <dest> <neighbor>",
                "add a static route (static router only)");
    add_to_help("del <dest>", "delete a static route");
    add_to_help("energy <neighbor> <battery_pct>",
                "report a neighbor's battery level to the router");
    add_to_help("dump", "dump the router state");
}

int
RouteCommand::exec(int argc, const char** argv, Tcl_Interp* interp)
{
    (void)interp;

    if (argc < 2) {
        resultf("need a route subcommand");
        return TCL_ERROR;
    }

    const char* cmd = argv[1];

    // route add <dest> <neighbor>
    // route del <dest>
    // route energy <neighbor> <battery_pct>
    // route dump
    int want;
    if (strcmp(cmd, "add") == 0 || strcmp(cmd, "energy") == 0) {
        want = 4;
    } else if (strcmp(cmd, "del") == 0) {
        want = 3;
    } else if (strcmp(cmd, "dump") == 0) {
        want = 2;
    } else {
        resultf("unimplemented route subcommand %s", cmd);
        return TCL_ERROR;
    }

    if (argc != want) {
        wrong_num_args(argc, argv, 2, want, want);
        return TCL_ERROR;
    }

    BundleNode* node = server_->node();
    if (node == NULL) {
        resultf("node not started");
        return TCL_ERROR;
    }

    if (strcmp(cmd, "add") == 0) {
        return route_add(node, argv[2], argv[3]);
    } else if (strcmp(cmd, "energy") == 0) {
        return route_energy(node, argv[2], argv[3]);
    } else if (strcmp(cmd, "del") == 0) {
        return route_del(node, argv[2]);
    }
    return route_dump(node);
}

//----------------------------------------------------------------------
StaticBundleRouter*
RouteCommand::static_router(BundleNode* node, const char* op)
{
    StaticBundleRouter* router =
        dynamic_cast<StaticBundleRouter*>(node->router());
    if (router == NULL) {
        resultf("route %s requires the static router (current: %s)",
                op, node->router()->name().c_str());
    }
    return router;
}

//----------------------------------------------------------------------
int
RouteCommand::route_add(BundleNode* node, const char* dest,
                        const char* next_hop)
{
    StaticBundleRouter* router = static_router(node, "add");
    if (router == NULL) {
        return TCL_ERROR;
    }

    router->add_route(dest, next_hop);
    return TCL_OK;
}

//----------------------------------------------------------------------
int
RouteCommand::route_del(BundleNode* node, const char* dest)
{
    StaticBundleRouter* router = static_router(node, "del");
    if (router == NULL) {
        return TCL_ERROR;
    }

    if (router->del_route(dest) != SKYDTN_SUCCESS) {
        resultf("no route to %s", dest);
        return TCL_ERROR;
    }
    return TCL_OK;
}

//----------------------------------------------------------------------
int
RouteCommand::route_energy(BundleNode* node, const char* neighbor,
                           const char* pct_str)
{
    char* end;
    double pct = strtod(pct_str, &end);
    if (end == pct_str || *end != '\0') {
        resultf("invalid battery level %s", pct_str);
        return TCL_ERROR;
    }

    node->router()->update_energy(neighbor, pct);
    return TCL_OK;
}

//----------------------------------------------------------------------
int
RouteCommand::route_dump(BundleNode* node)
{
    oasys::StringBuffer buf;
    node->router()->get_routing_state(&buf);
    set_result(buf.c_str());
    return TCL_OK;
}

} // namespace skydtn
