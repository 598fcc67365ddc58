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

#include <stdint.h>
#include <stdio.h>

#include "Bundle.h"
#include "skydtn_errno.h"

namespace skydtn {

const u_int8_t Bundle::BUNDLE_PROTOCOL_VERSION;

//----------------------------------------------------------------------
Bundle::Params::Params()
    : default_lifetime_secs_(86400),
      max_hop_count_(255)
{}

Bundle::Params Bundle::params_;

//----------------------------------------------------------------------
Bundle::Bundle()
    : version_(0),
      flags_(0),
      lifetime_millis_(0),
      crc_type_(CRC_NONE),
      hop_count_(0),
      priority_(COS_NORMAL)
{
}

//----------------------------------------------------------------------
Bundle::Bundle(const oasys::Builder&)
    : version_(0),
      flags_(0),
      lifetime_millis_(0),
      crc_type_(CRC_NONE),
      hop_count_(0),
      priority_(COS_NORMAL)
{
}

//----------------------------------------------------------------------
Bundle::~Bundle()
{
}

//----------------------------------------------------------------------
Bundle
Bundle::create(const std::string& source,
               const std::string& dest,
               const std::string& payload)
{
    return create(source, dest, payload,
                  lifetime_secs_to_millis(params_.default_lifetime_secs_));
}

//----------------------------------------------------------------------
u_int64_t
Bundle::lifetime_secs_to_millis(u_int64_t secs)
{
    if (secs > UINT64_MAX / 1000) {
        return UINT64_MAX;
    }
    return secs * 1000;
}

//----------------------------------------------------------------------
Bundle
Bundle::create(const std::string& source,
               const std::string& dest,
               const std::string& payload,
               u_int64_t lifetime_millis)
{
    Bundle b;
    b.version_         = BUNDLE_PROTOCOL_VERSION;
    b.source_          = source;
    b.dest_            = dest;
    b.report_to_       = source;
    b.creation_ts_     = BundleTimestamp::now();
    b.lifetime_millis_ = lifetime_millis;
    b.payload_         = payload;
    b.crc_type_        = CRC_16;
    b.priority_        = COS_NORMAL;
    b.hop_count_       = 0;
    b.build_id();
    return b;
}

//----------------------------------------------------------------------
void
Bundle::build_id()
{
    char buf[64];
    snprintf(buf, sizeof(buf), ", %" PRIu64 ".%" PRIu64 ">",
             creation_ts_.millis_, creation_ts_.seqno_);

    id_ = "<" + source_ + buf;
}

//----------------------------------------------------------------------
void
Bundle::stamp_source(const std::string& source)
{
    if (source_ == source) {
        return;
    }

    if (report_to_.empty() || report_to_ == source_) {
        report_to_ = source;
    }
    source_ = source;
}

//----------------------------------------------------------------------
int
Bundle::validate(oasys::StringBuffer* errbuf) const
{
    const char* reason = NULL;

    if (version_ != BUNDLE_PROTOCOL_VERSION) {
        reason = "unsupported protocol version";
    } else if (source_.empty()) {
        reason = "empty source endpoint";
    } else if (dest_.empty()) {
        reason = "empty destination endpoint";
    } else if (exceeds_hop_limit()) {
        reason = "hop count exceeds the maximum";
    } else if (priority_ > COS_EXPEDITED) {
        reason = "invalid priority";
    } else if (BundleTimestamp::get_current_time_millis() >= expiration_millis()) {
        reason = "bundle has expired";
    }

    if (reason == NULL) {
        return SKYDTN_SUCCESS;
    }

    if (errbuf != NULL) {
        errbuf->appendf("%s", reason);
    }
    return SKYDTN_EVALIDATION;
}

//----------------------------------------------------------------------
bool
Bundle::is_expired() const
{
    return BundleTimestamp::get_current_time_millis() > expiration_millis();
}

//----------------------------------------------------------------------
u_int64_t
Bundle::expiration_millis() const
{
    if (lifetime_millis_ > UINT64_MAX - creation_ts_.millis_) {
        return UINT64_MAX;
    }
    return creation_ts_.millis_ + lifetime_millis_;
}

//----------------------------------------------------------------------
u_int64_t
Bundle::time_to_expiration_millis() const
{
    u_int64_t now = BundleTimestamp::get_current_time_millis();
    u_int64_t expiration = expiration_millis();
    if (now >= expiration) {
        return 0;
    }
    return expiration - now;
}

//----------------------------------------------------------------------
int
Bundle::set_priority(int priority)
{
    if (priority < COS_BULK || priority > COS_EXPEDITED) {
        return SKYDTN_EVALIDATION;
    }

    priority_ = (u_int8_t)priority;
    return SKYDTN_SUCCESS;
}

//----------------------------------------------------------------------
void
Bundle::increment_hop(const std::string& node_id)
{
    ++hop_count_;
    prevhop_ = node_id;
}

//----------------------------------------------------------------------
bool
Bundle::exceeds_hop_limit() const
{
    return hop_count_ > params_.max_hop_count_;
}

//----------------------------------------------------------------------
SPtr_Bundle
Bundle::clone() const
{
    return std::make_shared<Bundle>(*this);
}

//----------------------------------------------------------------------
size_t
Bundle::size() const
{
    // fixed overhead for the primary block fields
    return 64 + source_.length() + dest_.length() + payload_.length();
}

//----------------------------------------------------------------------
bool
Bundle::same_contents(const Bundle& other) const
{
    return id_              == other.id_ &&
           version_         == other.version_ &&
           flags_           == other.flags_ &&
           source_          == other.source_ &&
           dest_            == other.dest_ &&
           report_to_       == other.report_to_ &&
           creation_ts_     == other.creation_ts_ &&
           lifetime_millis_ == other.lifetime_millis_ &&
           payload_         == other.payload_ &&
           crc_type_        == other.crc_type_ &&
           prevhop_         == other.prevhop_ &&
           hop_count_       == other.hop_count_ &&
           priority_        == other.priority_;
}

//----------------------------------------------------------------------
int
Bundle::format(char* buf, size_t sz) const
{
    return snprintf(buf, sz, "bundle %s [%s -> %s %zu byte payload, %s, hops %" PRIu64 "]",
                    id_.c_str(), source_.c_str(), dest_.c_str(),
                    payload_.length(), prioritytoa(priority_), hop_count_);
}

//----------------------------------------------------------------------
void
Bundle::format_verbose(oasys::StringBuffer* buf) const
{
    buf->appendf("bundle %s:\n", id_.c_str());
    buf->appendf("  Protocol Version: %u\n", version_);
    buf->appendf("             flags: 0x%x\n", flags_);
    buf->appendf("            source: %s\n", source_.c_str());
    buf->appendf("              dest: %s\n", dest_.c_str());
    buf->appendf("         report_to: %s\n", report_to_.c_str());
    buf->appendf("           prevhop: %s\n", prevhop_.c_str());
    buf->appendf("         hop count: %" PRIu64 "\n", hop_count_);
    buf->appendf("          priority: %s\n", prioritytoa(priority_));
    buf->appendf("          crc type: %u\n", crc_type_);
    buf->appendf("     creation time: %" PRIu64 ".%" PRIu64 "\n",
                 creation_ts_.millis_, creation_ts_.seqno_);
    buf->appendf("          lifetime: %" PRIu64 " ms\n", lifetime_millis_);
    buf->appendf("    time remaining: %" PRIu64 " ms\n", time_to_expiration_millis());
    buf->appendf("    payload length: %zu\n", payload_.length());
}

//----------------------------------------------------------------------
void
Bundle::serialize(oasys::SerializeAction* a)
{
    a->process("id", &id_);
    a->process("version", &version_);
    a->process("flags", &flags_);
    a->process("source", &source_);
    a->process("dest", &dest_);
    a->process("report_to", &report_to_);
    a->process("creation_ts_time", &creation_ts_.millis_);
    a->process("creation_ts_seqno", &creation_ts_.seqno_);
    a->process("lifetime", &lifetime_millis_);
    a->process("payload", &payload_);
    a->process("crc_type", &crc_type_);
    a->process("prevhop", &prevhop_);
    a->process("hop_count", &hop_count_);
    a->process("priority", &priority_);
}

} // namespace skydtn
