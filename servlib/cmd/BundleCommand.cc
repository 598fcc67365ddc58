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
#include <string.h>

#include <oasys/util/OptParser.h>
#include <oasys/util/StringBuffer.h>

#include "BundleCommand.h"
#include "SkyServer.h"
#include "bundling/Bundle.h"
#include "bundling/BundleNode.h"
#include "storage/BundleFilter.h"
#include "storage/BundleStore.h"
#include "skydtn_errno.h"

namespace skydtn {

static oasys::EnumOpt::Case PriorityCases[] = {
    {"bulk",      Bundle::COS_BULK},
    {"normal",    Bundle::COS_NORMAL},
    {"expedited", Bundle::COS_EXPEDITED},
    {0, 0}
};

BundleCommand::BundleCommand(SkyServer* server)
    : TclCommand("bundle"),
      server_(server)
{
    add_to_help("send <dest> <payload> [lifetime=<secs>] "
                "[priority=<bulk|normal|expedited>]",
                "originate a bundle from the local node");
    add_to_help("inject <source> <dest> <payload> [lifetime=<secs>] "
                "[priority=<bulk|normal|expedited>]",
                "hand a bundle to the node as if received from a neighbor");
    add_to_help("list [dest=<eid>] [source=<eid>] [status=<status>] "
                "[min_priority=<n>] [max_age=<secs>] [limit=<n>] "
                "[order=<none|priority|age|size>]",
                "list stored bundles");
    add_to_help("info <id>", "print all the fields of a stored bundle");
    add_to_help("del <id>", "delete a stored bundle");
    add_to_help("redrive", "requeue pending bundles for routing");
    add_to_help("sweep", "run an expiry sweep now");
    add_to_help("stats", "print the bundle store statistics");
}

BundleCommand::CreateOpts::CreateOpts()
    : lifetime_(Bundle::params_.default_lifetime_secs_),
      priority_(Bundle::COS_NORMAL)
{}

bool
BundleCommand::parse_create_options(CreateOpts* options,
                                    int argc, const char** argv, int first,
                                    const char** invalidp)
{
    oasys::OptParser p;

    p.addopt(new oasys::UInt64Opt("lifetime", &options->lifetime_));
    p.addopt(new oasys::EnumOpt("priority", PriorityCases, &options->priority_));

    for (int i = first; i < argc; i++) {
        const char* option_name = argv[i];
        int len = strlen(option_name);

        if (! p.parse_opt(option_name, len)) {
            *invalidp = option_name;
            return false;
        }
    }
    return true;
}

int
BundleCommand::exec(int argc, const char** argv, Tcl_Interp* interp)
{
    (void)interp;

    // need a subcommand
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

    if (strcmp(cmd, "send") == 0) {
        return process_create(argc, argv, false);
    }

    else if (strcmp(cmd, "inject") == 0) {
        return process_create(argc, argv, true);
    }

    else if (strcmp(cmd, "list") == 0) {
        return process_list(argc, argv);
    }

    else if (strcmp(cmd, "info") == 0) {
        // bundle info <id>
        if (argc != 3) {
            wrong_num_args(argc, argv, 2, 3, 3);
            return TCL_ERROR;
        }

        Bundle bundle;
        bundle_status_t status;
        if (node->store()->retrieve(argv[2], &bundle) != SKYDTN_SUCCESS ||
            node->store()->get_status(argv[2], &status) != SKYDTN_SUCCESS)
        {
            resultf("no bundle with id %s", argv[2]);
            return TCL_ERROR;
        }

        oasys::StringBuffer buf;
        bundle.format_verbose(&buf);
        buf.appendf("status: %s\n", bundle_status_to_str(status));
        set_result(buf.c_str());
        return TCL_OK;
    }

    else if (strcmp(cmd, "del") == 0) {
        // bundle del <id>
        if (argc != 3) {
            wrong_num_args(argc, argv, 2, 3, 3);
            return TCL_ERROR;
        }

        if (node->store()->del(argv[2]) != SKYDTN_SUCCESS) {
            resultf("no bundle with id %s", argv[2]);
            return TCL_ERROR;
        }
        return TCL_OK;
    }

    else if (strcmp(cmd, "redrive") == 0) {
        resultf("%zu", node->redrive_pending());
        return TCL_OK;
    }

    else if (strcmp(cmd, "sweep") == 0) {
        resultf("%zu", node->sweep_expired());
        return TCL_OK;
    }

    else if (strcmp(cmd, "stats") == 0) {
        oasys::StringBuffer buf;
        node->store()->get_stats(&buf);
        set_result(buf.c_str());
        return TCL_OK;
    }

    resultf("unknown bundle subcommand %s", cmd);
    return TCL_ERROR;
}

int
BundleCommand::process_create(int argc, const char** argv, bool inject)
{
    BundleNode* node = server_->node();

    // bundle send <dest> <payload> [opts]
    // bundle inject <source> <dest> <payload> [opts]
    int fixed = inject ? 5 : 4;
    if (argc < fixed) {
        wrong_num_args(argc, argv, 2, fixed, INT_MAX);
        return TCL_ERROR;
    }

    CreateOpts options;
    const char* invalid;
    if (! parse_create_options(&options, argc, argv, fixed, &invalid)) {
        resultf("error parsing bundle %s options: invalid option '%s'",
                argv[1], invalid);
        return TCL_ERROR;
    }

    std::string source = inject ? argv[2] : node->endpoint();
    const char* dest    = argv[fixed - 2];
    const char* payload = argv[fixed - 1];

    Bundle bundle = Bundle::create(source, dest, payload,
                                   Bundle::lifetime_secs_to_millis(options.lifetime_));
    if (bundle.set_priority(options.priority_) != SKYDTN_SUCCESS) {
        resultf("invalid priority %d", options.priority_);
        return TCL_ERROR;
    }

    int err = inject ? node->receive_bundle(bundle) : node->send_bundle(&bundle);
    if (err != SKYDTN_SUCCESS) {
        resultf("error %s bundle: %s", inject ? "injecting" : "sending",
                skydtn_strerror(err));
        return TCL_ERROR;
    }

    set_result(bundle.id().c_str());
    return TCL_OK;
}

int
BundleCommand::process_list(int argc, const char** argv)
{
    BundleNode* node = server_->node();

    std::string dest, source, status_str, order_str;
    int         min_priority = -1;
    u_int64_t   max_age = 0;
    u_int       limit = 0;

    oasys::OptParser p;
    p.addopt(new oasys::StringOpt("dest",         &dest));
    p.addopt(new oasys::StringOpt("source",       &source));
    p.addopt(new oasys::StringOpt("status",       &status_str));
    p.addopt(new oasys::IntOpt("min_priority",    &min_priority));
    p.addopt(new oasys::UInt64Opt("max_age",      &max_age));
    p.addopt(new oasys::UIntOpt("limit",          &limit));
    p.addopt(new oasys::StringOpt("order",        &order_str));

    for (int i = 2; i < argc; ++i) {
        if (! p.parse_opt(argv[i], strlen(argv[i]))) {
            resultf("invalid bundle list option '%s'", argv[i]);
            return TCL_ERROR;
        }
    }

    BundleFilter filter;
    filter.set_dest(dest)
          .set_source(source)
          .set_min_priority(min_priority)
          .set_max_age_millis(max_age * 1000)
          .set_limit(limit);

    if (! status_str.empty()) {
        bundle_status_t status;
        if (! str_to_bundle_status(status_str.c_str(), &status)) {
            resultf("invalid bundle status %s", status_str.c_str());
            return TCL_ERROR;
        }
        filter.set_status(status);
    }

    if (! order_str.empty()) {
        BundleFilter::order_t order;
        if (! BundleFilter::str_to_order(order_str.c_str(), &order)) {
            resultf("invalid list order %s", order_str.c_str());
            return TCL_ERROR;
        }
        filter.set_order(order);
    }

    BundleList bundles;
    int err = node->store()->list(filter, &bundles);
    if (err != SKYDTN_SUCCESS) {
        resultf("error listing bundles: %s", skydtn_strerror(err));
        return TCL_ERROR;
    }

    oasys::StringBuffer buf;
    BundleList::const_iterator iter;
    for (iter = bundles.begin(); iter != bundles.end(); ++iter) {
        buf.appendf("%s\n", iter->id().c_str());
    }
    set_result(buf.c_str());
    return TCL_OK;
}

} // namespace skydtn
