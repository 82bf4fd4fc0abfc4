#include "uuid.hpp"
#include <string>

namespace UUID{
    namespace {
        // Big endian pack of 8 octets.
        std::uint64_t pack(const unsigned char* octets){
            std::uint64_t value = 0;
            for(std::size_t i=0; i < 8; ++i){
                value = (value << 8) | octets[i];
            }
            return value;
        }

        void unpack(std::uint64_t value, unsigned char* octets){
            for(std::size_t i=0; i < 8; ++i){
                octets[7-i] = static_cast<unsigned char>(value & 0xff);
                value >>= 8;
            }
        }
    }

    Uuid::Uuid(const std::array<unsigned char, Uuid::size>& bytes)
      : high_{pack(&bytes[0])},
        low_{pack(&bytes[8])}
    {}

    Uuid::Uuid(const std::vector<unsigned char>& bytes)
      : Uuid()
    {
        if(bytes.size() != Uuid::size){
            throw std::length_error("UUID::Uuid: data must be 16 bytes in length, got " + std::to_string(bytes.size()) + ".");
        }
        high_ = pack(&bytes[0]);
        low_ = pack(&bytes[8]);
    }

    Uuid::Uuid(Variant variant, int version, std::vector<unsigned char> bytes)
      : Uuid()
    {
        if(bytes.size() < Uuid::size){
            throw std::length_error("UUID::Uuid: data must be at least 16 bytes in length, got " + std::to_string(bytes.size()) + ".");
        }
        const unsigned char tag = static_cast<unsigned char>(variant);
        // UUID clock_seq_hi_and_reserved is octet 8.
        unsigned char& clock_seq_hi_and_reserved = bytes[8];
        if((tag & 0x80) == 0){
            // NCS backward compatibility.
            clock_seq_hi_and_reserved &= 0x7f;
        } else if((tag & 0xc0) == 0x80){
            // RFC 4122.
            clock_seq_hi_and_reserved &= 0x3f;
            clock_seq_hi_and_reserved |= 0x80;
        } else if((tag & 0xe0) == 0xc0){
            // Microsoft mixed endian GUID.
            clock_seq_hi_and_reserved &= 0x1f;
            clock_seq_hi_and_reserved |= 0xc0;
        } else {
            // Reserved for future definition. The low bits are not cleared.
            clock_seq_hi_and_reserved |= 0xe0;
        }
        // The version is the high nibble of time_hi_and_version, octet 6.
        unsigned char& time_hi_and_version = bytes[6];
        time_hi_and_version = static_cast<unsigned char>((time_hi_and_version & 0x0f) | ((version & 0x0f) << 4));

        high_ = pack(&bytes[0]);
        low_ = pack(&bytes[8]);
    }

    Variant Uuid::variant() const {
        const unsigned char clock_seq_hi_and_reserved = static_cast<unsigned char>(low_ >> 56);
        // Positive as a signed octet. 0x00 is not positive so it is not NCS.
        if(clock_seq_hi_and_reserved != 0 && (clock_seq_hi_and_reserved & 0x80) == 0){
            return Variant::NCS;
        }
        if((clock_seq_hi_and_reserved & 0xc0) == 0x80){
            return Variant::RFC4122;
        }
        if((clock_seq_hi_and_reserved & 0xe0) == 0xc0){
            return Variant::MICROSOFT;
        }
        return Variant::FUTURE;
    }

    int Uuid::version() const {
        return static_cast<int>((high_ >> 12) & 0x0f);
    }

    std::uint32_t Uuid::time_low() const {
        return static_cast<std::uint32_t>(high_ >> 32);
    }
    std::uint16_t Uuid::time_mid() const {
        return static_cast<std::uint16_t>((high_ >> 16) & 0xffff);
    }
    std::uint16_t Uuid::time_hi() const {
        return static_cast<std::uint16_t>(high_ & 0x0fff);
    }
    std::uint16_t Uuid::time_hi_and_version() const {
        return static_cast<std::uint16_t>(high_ & 0xffff);
    }
    unsigned char Uuid::clock_seq_hi_and_reserved() const {
        return static_cast<unsigned char>(low_ >> 56);
    }
    unsigned char Uuid::clock_seq_low() const {
        return static_cast<unsigned char>((low_ >> 48) & 0xff);
    }

    std::uint64_t Uuid::timestamp() const {
        return (static_cast<std::uint64_t>(time_hi()) << 48)
            | (static_cast<std::uint64_t>(time_mid()) << 32)
            | time_low();
    }

    std::uint16_t Uuid::clock_sequence() const {
        // Mask out the variant bits, their width depends on the variant.
        std::uint16_t mask = 0x1fff;
        switch(variant()){
            case Variant::NCS:
                mask = 0x7fff;
                break;
            case Variant::RFC4122:
                mask = 0x3fff;
                break;
            default:
                break;
        }
        return static_cast<std::uint16_t>((low_ >> 48) & mask);
    }

    std::uint64_t Uuid::node() const {
        return low_ & 0x0000ffffffffffffULL;
    }

    std::array<unsigned char, Uuid::size> Uuid::bytes() const {
        std::array<unsigned char, Uuid::size> octets{};
        unpack(high_, &octets[0]);
        unpack(low_, &octets[8]);
        return octets;
    }

    bool Uuid::is_nil() const {
        return high_ == 0 && low_ == 0;
    }

    std::uint32_t Uuid::hash_code() const {
        const std::uint64_t hilo = high_ ^ low_;
        return static_cast<std::uint32_t>(hilo >> 32) ^ static_cast<std::uint32_t>(hilo & 0xffffffff);
    }

    int Uuid::compare(const Uuid& other) const {
        if(high_ != other.high_){
            return (high_ < other.high_) ? -1 : 1;
        }
        if(low_ != other.low_){
            return (low_ < other.low_) ? -1 : 1;
        }
        return 0;
    }

    bool operator==(const Uuid& lhs, const Uuid& rhs){
        return lhs.high() == rhs.high() && lhs.low() == rhs.low();
    }

    bool operator!=(const Uuid& lhs, const Uuid& rhs){
        return !(lhs == rhs);
    }

    bool operator<(const Uuid& lhs, const Uuid& rhs){
        return lhs.compare(rhs) < 0;
    }

    bool operator<=(const Uuid& lhs, const Uuid& rhs){
        return lhs.compare(rhs) <= 0;
    }

    bool operator>(const Uuid& lhs, const Uuid& rhs){
        return lhs.compare(rhs) > 0;
    }

    bool operator>=(const Uuid& lhs, const Uuid& rhs){
        return lhs.compare(rhs) >= 0;
    }
}
