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

#ifndef _BUNDLE_COMMAND_H_
#define _BUNDLE_COMMAND_H_

#include <string>

#include <oasys/tclcmd/TclCommand.h>

namespace skydtn {

class SkyServer;

/**
 * Command for originating, inspecting and managing bundles.
 */
class BundleCommand : public oasys::TclCommand {
public:
    BundleCommand(SkyServer* server);

    virtual int exec(int argc, const char** argv, Tcl_Interp* interp);

private:
    /**
     * "bundle send" and "bundle inject" options
     */
    class CreateOpts {
    public:
        CreateOpts();

        u_int64_t lifetime_;    ///< Bundle lifetime in seconds
        int       priority_;    ///< Class of service
    };

    /**
     * Parse the options following the fixed arguments of a send or
     * inject command
     */
    bool parse_create_options(CreateOpts* options, int argc, const char** argv,
                              int first, const char** invalidp);

    int process_create(int argc, const char** argv, bool inject);
    int process_list(int argc, const char** argv);

    SkyServer* server_;
};

} // namespace skydtn

#endif /* _BUNDLE_COMMAND_H_ */
