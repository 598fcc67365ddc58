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

#ifndef _STORED_BUNDLE_H_
#define _STORED_BUNDLE_H_

#include <oasys/serialize/Serialize.h>

#include "bundling/Bundle.h"
#include "bundling/BundleStatus.h"

namespace skydtn {

/**
 * One stored copy of a bundle together with its custody status and
 * the time it was put in the store. This is the record type of every
 * BundleStore implementation.
 */
class StoredBundle : public oasys::SerializableObject {
public:
    StoredBundle();
    StoredBundle(const oasys::Builder&);
    StoredBundle(const Bundle& bundle, bundle_status_t status);

    virtual ~StoredBundle();

    /**
     * Virtual from SerializableObject.
     */
    void serialize(oasys::SerializeAction* a);

    Bundle          bundle_;
    bundle_status_t status_;
    u_int64_t       stored_millis_;  ///< millis since 1/1/2000
};

} // namespace skydtn

#endif /* _STORED_BUNDLE_H_ */
