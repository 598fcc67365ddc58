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

#include <oasys/debug/Log.h>

#include "BundleNode.h"
#include "LoopbackTransmitter.h"
#include "skydtn_errno.h"

namespace skydtn {

//----------------------------------------------------------------------
LoopbackTransmitter::LoopbackTransmitter()
    : Logger("LoopbackTransmitter", "/skydtn/link/loopback")
{
}

//----------------------------------------------------------------------
LoopbackTransmitter::~LoopbackTransmitter()
{
}

//----------------------------------------------------------------------
void
LoopbackTransmitter::add_peer(const std::string& neighbor_id, BundleNode* node)
{
    oasys::ScopeLock l(&lock_, "LoopbackTransmitter::add_peer");
    peers_[neighbor_id] = node;
}

//----------------------------------------------------------------------
int
LoopbackTransmitter::del_peer(const std::string& neighbor_id)
{
    oasys::ScopeLock l(&lock_, "LoopbackTransmitter::del_peer");

    if (peers_.erase(neighbor_id) == 0) {
        return SKYDTN_ENOTFOUND;
    }
    return SKYDTN_SUCCESS;
}

//----------------------------------------------------------------------
int
LoopbackTransmitter::transmit(const std::string& next_hop, const Bundle& bundle)
{
    BundleNode* peer = NULL;
    {
        oasys::ScopeLock l(&lock_, "LoopbackTransmitter::transmit");

        PeerMap::iterator iter = peers_.find(next_hop);
        if (iter != peers_.end()) {
            peer = iter->second;
        }
    }

    if (peer == NULL) {
        log_warn("transmit: no peer %s for bundle %s",
                 next_hop.c_str(), bundle.id().c_str());
        return SKYDTN_ENOTFOUND;
    }

    int err = peer->receive_bundle(bundle);
    if (err != SKYDTN_SUCCESS) {
        log_notice("transmit: peer %s refused bundle %s: %s",
                   next_hop.c_str(), bundle.id().c_str(),
                   skydtn_strerror(err));
    }
    return err;
}

//----------------------------------------------------------------------
size_t
LoopbackTransmitter::num_peers() const
{
    oasys::ScopeLock l(&lock_, "LoopbackTransmitter::num_peers");
    return peers_.size();
}

} // namespace skydtn
