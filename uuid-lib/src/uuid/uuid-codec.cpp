#include "uuid.hpp"
#include <charconv>
#include <iomanip>
#include <sstream>

namespace UUID{
    namespace {
        std::size_t find_dash(const std::string& uuid, std::size_t pos){
            std::size_t dash = uuid.find('-', pos);
            if(dash == std::string::npos){
                throw InvalidUuidString(uuid, "missing dashes", std::make_error_code(std::errc::invalid_argument));
            }
            return dash;
        }

        // Converts uuid[first, last) from hex. The whole group must be consumed,
        // its width is not checked beyond fitting in 64 bits.
        std::uint64_t parse_group(const std::string& uuid, std::size_t first, std::size_t last){
            const char* begin = uuid.data() + first;
            const char* end = uuid.data() + last;
            std::uint64_t value = 0;
            std::from_chars_result res = std::from_chars(begin, end, value, 16);
            if(res.ec != std::errc{}){
                throw InvalidUuidString(uuid, "group conversion failed", std::make_error_code(res.ec));
            }
            if(res.ptr != end){
                throw InvalidUuidString(uuid, "group conversion failed", std::make_error_code(std::errc::invalid_argument));
            }
            return value;
        }
    }

    InvalidUuidString::InvalidUuidString(const std::string& str, const std::string& reason, std::error_code ec)
      : std::invalid_argument("Invalid UUID string: " + str + ": " + reason + ": " + ec.message()),
        str_(str),
        ec_(ec)
    {}

    Uuid::Uuid(Uuid::String, const std::string& uuid)
      : Uuid(Uuid::from_string(uuid))
    {}

    Uuid Uuid::from_string(const std::string& uuid){
        std::size_t dash1 = uuid.find('-');
        if(dash1 == std::string::npos || dash1 < 8){
            throw InvalidUuidString(uuid, "missing dashes", std::make_error_code(std::errc::invalid_argument));
        }
        std::uint64_t time_low = parse_group(uuid, 0, dash1);

        std::size_t dash2 = find_dash(uuid, dash1+1);
        std::uint64_t time_mid = parse_group(uuid, dash1+1, dash2);

        std::size_t dash3 = find_dash(uuid, dash2+1);
        std::uint64_t time_hi_and_version = parse_group(uuid, dash2+1, dash3);

        std::size_t dash4 = find_dash(uuid, dash3+1);
        std::uint64_t clock_seq = parse_group(uuid, dash3+1, dash4);

        std::uint64_t node = parse_group(uuid, dash4+1, uuid.size());

        return Uuid(time_low << 32 | time_mid << 16 | time_hi_and_version, clock_seq << 48 | node);
    }

    std::string Uuid::to_string() const {
        std::ostringstream ss;
        ss << *this;
        return ss.str();
    }

    Uuid from_string(const std::string& uuid){
        return Uuid::from_string(uuid);
    }

    std::ostream& operator<<(std::ostream& os, const Uuid& uuid){
        std::ios::fmtflags os_flags(os.flags());
        char os_fill = os.fill();
        // Lower case, right aligned, no 0x prefix, regardless of the caller's flags.
        os.flags(std::ios::hex | std::ios::right);
        os << std::setfill('0') << std::setw(8) << uuid.time_low() << '-';
        os << std::setfill('0') << std::setw(4) << uuid.time_mid() << '-';
        os << std::setfill('0') << std::setw(4) << uuid.time_hi_and_version() << '-';
        os << std::setfill('0') << std::setw(2) << static_cast<std::uint16_t>(uuid.clock_seq_hi_and_reserved());
        os << std::setfill('0') << std::setw(2) << static_cast<std::uint16_t>(uuid.clock_seq_low()) << '-';
        os << std::setfill('0') << std::setw(12) << uuid.node();
        os.fill(os_fill);
        os.flags(os_flags);
        return os;
    }

    std::istream& operator>>(std::istream& is, Uuid& uuid){
        std::string token;
        if(!(is >> token)){
            return is;
        }
        try{
            uuid = Uuid::from_string(token);
        } catch(const InvalidUuidString&){
            is.setstate(std::ios_base::failbit);
        }
        return is;
    }
}
