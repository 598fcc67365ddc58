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

#include "ParamCommand.h"
#include "bundling/Bundle.h"
#include "bundling/BundleNode.h"

namespace skydtn {

ParamCommand::ParamCommand()
    : TclCommand("param")
{
    bind_var(new oasys::UInt64Opt("default_lifetime",
                                  &Bundle::params_.default_lifetime_secs_,
                                  "seconds",
                                  "Lifetime given to locally created bundles "
                                  "(default 86400)"));

    bind_var(new oasys::UInt64Opt("max_hop_count",
                                  &Bundle::params_.max_hop_count_,
                                  "hops",
                                  "Hop count above which a bundle is failed "
                                  "instead of forwarded (default 255)"));

    bind_var(new oasys::UIntOpt("ingress_capacity",
                                &BundleNode::params_.ingress_capacity_,
                                "bundles",
                                "Bound of the node ingress queue, applied "
                                "when the node is started (default 1000)"));

    bind_var(new oasys::UIntOpt("egress_capacity",
                                &BundleNode::params_.egress_capacity_,
                                "bundles",
                                "Bound of the node egress queue, applied "
                                "when the node is started (default 1000)"));

    bind_var(new oasys::UIntOpt("sweep_interval_ms",
                                &BundleNode::params_.sweep_interval_ms_,
                                "millisecs",
                                "Interval between expiry sweeps "
                                "(default 300000)"));

    bind_var(new oasys::UIntOpt("neighbor_timeout",
                                &BundleNode::params_.neighbor_timeout_secs_,
                                "seconds",
                                "Silence after which a neighbor is marked "
                                "inactive, 0 to disable (default 600)"));

    bind_var(new oasys::BoolOpt("suppress_duplicates",
                                &BundleNode::params_.suppress_duplicates_,
                                "Drop arriving bundles that are already stored "
                                "(default is true)"));
}

} // namespace skydtn
