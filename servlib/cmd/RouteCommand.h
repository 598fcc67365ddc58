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

#ifndef _ROUTE_COMMAND_H_
#define _ROUTE_COMMAND_H_

#include <oasys/tclcmd/TclCommand.h>

namespace skydtn {

class BundleNode;
class SkyServer;
class StaticBundleRouter;

/**
 * The "route" command. Tunes the router parameters and edits the
 * static route table of a running node.
 */
class RouteCommand : public oasys::TclCommand {
public:
    RouteCommand(SkyServer* server);

    virtual int exec(int argc, const char** argv, Tcl_Interp* interp);

private:
    int route_add(BundleNode* node, const char* dest, const char* next_hop);
    int route_del(BundleNode* node, const char* dest);
    int route_energy(BundleNode* node, const char* neighbor,
                     const char* pct_str);
    int route_dump(BundleNode* node);

    /// The node's router as a static router, or NULL (with the
    /// command result set) when another router is configured.
    StaticBundleRouter* static_router(BundleNode* node, const char* op);

    SkyServer* server_;
};

} // namespace skydtn

#endif /* _ROUTE_COMMAND_H_ */
