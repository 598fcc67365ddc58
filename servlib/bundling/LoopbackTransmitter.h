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

#ifndef _LOOPBACK_TRANSMITTER_H_
#define _LOOPBACK_TRANSMITTER_H_

#include <map>

#include <oasys/debug/Logger.h>
#include <oasys/thread/SpinLock.h>

#include "BundleTransmitter.h"

namespace skydtn {

class BundleNode;

/**
 * Transmitter that connects nodes living in the same process: a
 * bundle sent to a neighbor id is handed straight to that node's
 * receive_bundle(). Used for simulated links.
 */
class LoopbackTransmitter : public BundleTransmitter,
                            public oasys::Logger
{
public:
    LoopbackTransmitter();
    virtual ~LoopbackTransmitter();

    /**
     * Register the node reached through a neighbor id. The node is
     * not owned.
     */
    void add_peer(const std::string& neighbor_id, BundleNode* node);

    /// Remove a peer; SKYDTN_ENOTFOUND if not registered
    int del_peer(const std::string& neighbor_id);

    /// Virtual from BundleTransmitter
    int transmit(const std::string& next_hop, const Bundle& bundle);

    size_t num_peers() const;

protected:
    typedef std::map<std::string, BundleNode*> PeerMap;

    PeerMap                 peers_;
    mutable oasys::SpinLock lock_;
};

} // namespace skydtn

#endif /* _LOOPBACK_TRANSMITTER_H_ */
