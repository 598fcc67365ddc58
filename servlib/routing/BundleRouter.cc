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

#include <math.h>
#include <string.h>

#include <oasys/debug/Log.h>

#include "BundleRouter.h"
#include "EnergyAwareRouter.h"
#include "StaticBundleRouter.h"
#include "skydtn_errno.h"

namespace skydtn {

//----------------------------------------------------------------------
BundleRouter::Config::Config()
    : type_("energy"),
      quality_weight_(0.7),
      energy_weight_(0.3),
      low_quality_threshold_(0.3),
      penalized_energy_score_(0.3),
      low_battery_pct_(20.0) {}

BundleRouter::Config BundleRouter::config_;

//----------------------------------------------------------------------
BundleRouter*
BundleRouter::create_router(const char* type)
{
    if (!strcmp(type, "energy")) {
        oasys::StaticStringBuffer<128> errbuf;
        if (validate_config(&errbuf) != SKYDTN_SUCCESS) {
            log_err_p("/skydtn/route", "invalid energy router configuration: %s",
                      errbuf.c_str());
            return NULL;
        }
        return new EnergyAwareRouter();
    }
    else if (!strcmp(type, "static")) {
        return new StaticBundleRouter();
    }

    log_err_p("/skydtn/route", "unknown router type %s", type);
    return NULL;
}

//----------------------------------------------------------------------
int
BundleRouter::validate_config(oasys::StringBuffer* errbuf)
{
    static const double WEIGHT_EPSILON = 1e-6;

    const char* reason = NULL;
    if (config_.quality_weight_ < 0 || config_.energy_weight_ < 0) {
        reason = "weights must not be negative";
    } else if (fabs(config_.quality_weight_ + config_.energy_weight_ - 1.0)
               > WEIGHT_EPSILON) {
        reason = "quality_weight and energy_weight must sum to 1";
    } else if (config_.low_quality_threshold_ < 0 ||
               config_.low_quality_threshold_ > 1) {
        reason = "low_quality_threshold must be within [0,1]";
    } else if (config_.penalized_energy_score_ < 0 ||
               config_.penalized_energy_score_ > 1) {
        reason = "penalized_energy_score must be within [0,1]";
    } else if (config_.low_battery_pct_ < 0 ||
               config_.low_battery_pct_ > 100) {
        reason = "low_battery_pct must be within [0,100]";
    }

    if (reason == NULL) {
        return SKYDTN_SUCCESS;
    }

    if (errbuf != NULL) {
        errbuf->appendf("%s (quality_weight %g, energy_weight %g)", reason,
                        config_.quality_weight_, config_.energy_weight_);
    }
    return SKYDTN_EVALIDATION;
}

//----------------------------------------------------------------------
BundleRouter::BundleRouter(const char* classname, const std::string& name)
    : Logger(classname, "/skydtn/route/%s", name.c_str()),
      name_(name)
{
}

//----------------------------------------------------------------------
BundleRouter::~BundleRouter()
{
}

//----------------------------------------------------------------------
void
BundleRouter::update_energy(const std::string& neighbor_id, double battery_pct)
{
    (void)neighbor_id;
    (void)battery_pct;
}

//----------------------------------------------------------------------
const Neighbor*
BundleRouter::find_direct(const Bundle&           bundle,
                          const NeighborSnapshot& neighbors)
{
    NeighborSnapshot::const_iterator iter;
    for (iter = neighbors.begin(); iter != neighbors.end(); ++iter) {
        if (iter->active_ && iter->eid_ == bundle.dest()) {
            return &(*iter);
        }
    }
    return NULL;
}

//----------------------------------------------------------------------
bool
BundleRouter::any_active(const NeighborSnapshot& neighbors)
{
    NeighborSnapshot::const_iterator iter;
    for (iter = neighbors.begin(); iter != neighbors.end(); ++iter) {
        if (iter->active_) {
            return true;
        }
    }
    return false;
}

} // namespace skydtn
