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

#ifndef _BUNDLE_H_
#define _BUNDLE_H_

#include <memory>
#include <string>
#include <vector>

#include <oasys/compat/inttypes.h>
#include <oasys/debug/Formatter.h>
#include <oasys/serialize/Serialize.h>
#include <oasys/util/StringBuffer.h>

#include "BundleTimestamp.h"

namespace skydtn {

class Bundle;

typedef std::shared_ptr<Bundle> SPtr_Bundle;
typedef std::vector<Bundle>      BundleList;

/**
 * The internal representation of a bundle.
 *
 * A Bundle is a value: copying it copies the payload and every other
 * field, so a copy never aliases the original. The addressing,
 * lifetime and payload are fixed once the bundle is created. The only
 * state that changes as a bundle moves through the network is the hop
 * count and previous hop annotation, updated through increment_hop().
 *
 * Custody status is not part of the bundle; it is tracked per stored
 * copy by the BundleStore.
 */
class Bundle : public oasys::Formatter,
               public oasys::SerializableObject
{
public:
    /**
     * Protocol version stamped on every bundle.
     */
    static const u_int8_t BUNDLE_PROTOCOL_VERSION = 7;

    /**
     * Values for the bundle priority field.
     */
    typedef enum {
        COS_INVALID   = -1,        ///< invalid
        COS_BULK      = 0,         ///< lowest priority
        COS_NORMAL    = 1,         ///< regular priority
        COS_EXPEDITED = 2,         ///< important
    } priority_values_t;

    /**
     * Pretty printer function for bundle priority.
     */
    static const char* prioritytoa(u_int8_t priority) {
        switch (priority) {
        case COS_BULK:      return "BULK";
        case COS_NORMAL:    return "NORMAL";
        case COS_EXPEDITED: return "EXPEDITED";
        default:            return "_UNKNOWN_PRIORITY_";
        }
    }

    /**
     * Integrity check types for the primary block.
     */
    typedef enum {
        CRC_NONE  = 0,
        CRC_16    = 1,
        CRC_32C   = 2,
    } crc_type_t;

    /**
     * Tunable parameters applied to newly created and validated bundles.
     */
    struct Params {
        Params();

        /// Lifetime in seconds given to bundles by create()
        u_int64_t default_lifetime_secs_;

        /// Maximum number of hops a bundle may take
        u_int64_t max_hop_count_;
    };

    static Params params_;

    /**
     * Default constructor for an empty (and invalid) bundle.
     */
    Bundle();

    /**
     * Constructor when re-reading the database.
     */
    Bundle(const oasys::Builder&);

    virtual ~Bundle();

    /**
     * Create a new bundle with the current time as creation time, the
     * default lifetime, normal priority and a hop count of zero.
     */
    static Bundle create(const std::string& source,
                         const std::string& dest,
                         const std::string& payload);

    /**
     * Same as above with an explicit lifetime in milliseconds.
     */
    static Bundle create(const std::string& source,
                         const std::string& dest,
                         const std::string& payload,
                         u_int64_t lifetime_millis);

    /**
     * Convert a lifetime in seconds to milliseconds, saturating at
     * the largest representable value.
     */
    static u_int64_t lifetime_secs_to_millis(u_int64_t secs);

    /**
     * Check the version, endpoints, hop count ceiling and expiration.
     * A bundle is only valid strictly before creation time + lifetime.
     * Returns SKYDTN_SUCCESS or SKYDTN_EVALIDATION, with the reason
     * appended to errbuf if one is given.
     */
    int validate(oasys::StringBuffer* errbuf = NULL) const;

    /**
     * True once the current time is past creation time + lifetime.
     * Always recomputed from the clock.
     */
    bool is_expired() const;

    /**
     * Creation time + lifetime in millis since 1/1/2000, saturated
     * instead of wrapping for very long lifetimes.
     */
    u_int64_t expiration_millis() const;

    /**
     * Milliseconds left before the bundle expires (0 if expired).
     */
    u_int64_t time_to_expiration_millis() const;

    /**
     * Set the priority, rejecting anything outside bulk..expedited
     * with SKYDTN_EVALIDATION.
     */
    int set_priority(int priority);

    /**
     * Record one more hop through node_id. Callers must check
     * exceeds_hop_limit() afterwards; a bundle past the ceiling is
     * dropped, not forwarded.
     */
    void increment_hop(const std::string& node_id);

    /**
     * True if the hop count is above the configured ceiling.
     */
    bool exceeds_hop_limit() const;

    /**
     * Allocate a deep copy of this bundle.
     */
    SPtr_Bundle clone() const;

    /**
     * Approximate footprint in bytes, used for storage accounting.
     */
    size_t size() const;

    /**
     * Virtual from formatter.
     */
    int format(char* buf, size_t sz) const;

    /**
     * Multi-line dump of every field.
     */
    void format_verbose(oasys::StringBuffer* buf) const;

    /**
     * Virtual from SerializableObject.
     */
    void serialize(oasys::SerializeAction* a);

    /// @{ Accessors
    const std::string& id()                 const { return id_; }
    u_int8_t           version()            const { return version_; }
    u_int32_t          flags()              const { return flags_; }
    const std::string& source()             const { return source_; }
    const std::string& dest()               const { return dest_; }
    const std::string& report_to()          const { return report_to_; }
    const BundleTimestamp& creation_ts()    const { return creation_ts_; }
    u_int64_t          lifetime_millis()    const { return lifetime_millis_; }
    const std::string& payload()            const { return payload_; }
    u_int8_t           crc_type()           const { return crc_type_; }
    const std::string& prevhop()            const { return prevhop_; }
    u_int64_t          hop_count()          const { return hop_count_; }
    u_int8_t           priority()           const { return priority_; }
    /// @}

    /**
     * Equality is by id: two bundles with the same id are copies of
     * the same logical message.
     */
    bool operator==(const Bundle& other) const { return id_ == other.id_; }
    bool operator!=(const Bundle& other) const { return id_ != other.id_; }

    /**
     * Field-by-field comparison of every attribute, used to check that
     * a stored copy was not altered.
     */
    bool same_contents(const Bundle& other) const;

protected:
    friend class BundleNode;

    /**
     * Replace the source (and report-to, when it tracked the source)
     * with the sending node's endpoint. The id is kept as built by
     * create(). Only done by the node before the bundle is first
     * stored.
     */
    void stamp_source(const std::string& source);

    /**
     * Build the id from the source and creation timestamp.
     */
    void build_id();

    std::string     id_;
    u_int8_t        version_;
    u_int32_t       flags_;
    std::string     source_;
    std::string     dest_;
    std::string     report_to_;
    BundleTimestamp creation_ts_;
    u_int64_t       lifetime_millis_;
    std::string     payload_;
    u_int8_t        crc_type_;

    // transit state
    std::string     prevhop_;
    u_int64_t       hop_count_;

    u_int8_t        priority_;
};

} // namespace skydtn

#endif /* _BUNDLE_H_ */
