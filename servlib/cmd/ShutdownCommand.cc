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

#include <oasys/debug/Log.h>

#include "ShutdownCommand.h"
#include "SkyServer.h"

namespace skydtn {

namespace {

// Runs from the Tcl event loop once the command has returned.
void
shutdown_timer_cb(void* arg)
{
    static_cast<SkyServer*>(arg)->shutdown();
    oasys::TclCommandInterp::instance()->exit_event_loop();
}

} // namespace

//----------------------------------------------------------------------
ShutdownCommand::ShutdownCommand(SkyServer* server, const char* cmd)
    : TclCommand(cmd),
      server_(server)
{
    add_to_help("", "stop the node and exit");
    add_to_help("<delay_ms>", "stop the node and exit after a delay");
}

//----------------------------------------------------------------------
int
ShutdownCommand::exec(int argc, const char** argv, Tcl_Interp* interp)
{
    (void)interp;

    if (argc > 2) {
        wrong_num_args(argc, argv, 1, 1, 2);
        return TCL_ERROR;
    }

    int delay_ms = 0;
    if (argc == 2) {
        char* end;
        long val = strtol(argv[1], &end, 10);
        if (end == argv[1] || *end != '\0' || val < 0) {
            resultf("invalid delay %s", argv[1]);
            return TCL_ERROR;
        }
        delay_ms = static_cast<int>(val);
    }

    log_notice_p("/skydtn/cmd/shutdown", "%s requested (delay %d ms)",
                 name(), delay_ms);
    Tcl_CreateTimerHandler(delay_ms, shutdown_timer_cb, server_);
    return TCL_OK;
}

} // namespace skydtn
