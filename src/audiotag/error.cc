#include <audiotag/error.hh>

namespace audiotag {

    const char* to_string(error_kind kind) {
        switch (kind) {
            case error_kind::io: return "I/O error";
            case error_kind::format_mismatch: return "format mismatch";
            case error_kind::unsupported_version: return "unsupported version";
            case error_kind::unsupported_format: return "unsupported format";
            case error_kind::checksum_mismatch: return "checksum mismatch";
            case error_kind::orphaned_continuation: return "orphaned continuation";
            case error_kind::no_tags_found: return "no tags found";
            case error_kind::invalid_argument: return "invalid argument";
        }
        return "unknown error";
    }

    audiotag_error::audiotag_error(error_kind kind, const std::string& what)
        : std::runtime_error(what)
        , m_kind(kind) {
    }

} // namespace audiotag
