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

#ifndef _BUNDLE_TRANSMITTER_H_
#define _BUNDLE_TRANSMITTER_H_

#include <string>

#include "Bundle.h"

namespace skydtn {

/**
 * Boundary to the link layer. The node hands each bundle selected for
 * forwarding to the transmitter together with the chosen neighbor id;
 * framing, link retransmission and the physical link are the
 * transmitter's business.
 */
class BundleTransmitter {
public:
    virtual ~BundleTransmitter() {}

    /**
     * Send the bundle toward the neighbor.
     *
     * @return SKYDTN_SUCCESS if the link accepted the bundle
     */
    virtual int transmit(const std::string& next_hop, const Bundle& bundle) = 0;
};

/**
 * Boundary to the local consumer of bundles addressed to this node.
 */
class LocalDeliveryHandler {
public:
    virtual ~LocalDeliveryHandler() {}

    /**
     * Called once for each bundle delivered to the local endpoint.
     */
    virtual void deliver_bundle(const Bundle& bundle) = 0;
};

} // namespace skydtn

#endif /* _BUNDLE_TRANSMITTER_H_ */
