#ifndef UUID_HPP
#define UUID_HPP
#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>
namespace UUID{
    // Variant tags as defined in IETF RFC 4122:
    // https://datatracker.ietf.org/doc/html/rfc4122#section-4.1.1
    // The values are the bit patterns stored in the most significant bits of
    // octet 8 (clock_seq_hi_and_reserved).
    enum class Variant: unsigned char
    {
        NCS = 0x00,
        RFC4122 = 0x80,
        MICROSOFT = 0xC0,
        FUTURE = 0xE0
    };

    // Thrown when a string is not a hyphenated RFC 4122 UUID.
    // Carries the offending string and the reason the
    // hexadecimal conversion failed.
    class InvalidUuidString: public std::invalid_argument
    {
    public:
        InvalidUuidString(const std::string& str, const std::string& reason, std::error_code ec);

        const std::string& str() const { return str_; }
        const std::error_code& code() const { return ec_; }
    private:
        std::string str_;
        std::error_code ec_;
    };

    // UUID binary fields as defined in IETF RFC 4122:
    // https://datatracker.ietf.org/doc/html/rfc4122#section-4.1.2
    // The 16 octets are held big-endian in two 64 bit halves, octet 0 is the
    // most significant byte of high() and octet 15 the least significant byte of low().
    // A default constructed Uuid is the nil UUID (all zeros).
    class Uuid
    {
    public:
        constexpr static struct Version1{} v1{};
        constexpr static struct Version3{} v3{};
        constexpr static struct Version4{} v4{};
        constexpr static struct Version5{} v5{};
        constexpr static struct String{} str{};
        constexpr static std::size_t size = 16; // UUID is always a 16 byte array.

        constexpr Uuid(): high_{0}, low_{0} {}
        constexpr Uuid(std::uint64_t high, std::uint64_t low): high_{high}, low_{low} {}
        explicit Uuid(const std::array<unsigned char, Uuid::size>& bytes);
        // Throws std::length_error unless bytes holds exactly 16 octets.
        explicit Uuid(const std::vector<unsigned char>& bytes);
        // Overwrites the variant bits of octet 8 and the version nibble of octet 6
        // before packing. Requires at least 16 octets, only the first 16 are used.
        Uuid(Variant variant, int version, std::vector<unsigned char> bytes);

        explicit Uuid(Uuid::Version4); // random.
        explicit Uuid(Uuid::Version1); // time based, current time.
        template<class Duration>
        Uuid(Uuid::Version1, std::chrono::time_point<std::chrono::system_clock, Duration> time);
        Uuid(Uuid::Version3, const Uuid& name_space, const std::string& name);
        Uuid(Uuid::Version3, const Uuid& name_space, const std::vector<unsigned char>& name);
        Uuid(Uuid::Version5, const Uuid& name_space, const std::string& name);
        Uuid(Uuid::Version5, const Uuid& name_space, const std::vector<unsigned char>& name);
        Uuid(Uuid::String, const std::string& uuid);

        // Throws InvalidUuidString.
        static Uuid from_string(const std::string& uuid);

        std::uint64_t high() const { return high_; }
        std::uint64_t low() const { return low_; }

        Variant variant() const;
        int version() const;

        std::uint32_t time_low() const;
        std::uint16_t time_mid() const;
        std::uint16_t time_hi() const;
        std::uint16_t time_hi_and_version() const;
        unsigned char clock_seq_hi_and_reserved() const;
        unsigned char clock_seq_low() const;

        // 100 ns ticks since 1582-10-15T00:00:00Z. Only meaningful for version 1.
        std::uint64_t timestamp() const;
        // Clock sequence without the variant bits. Only meaningful for version 1.
        std::uint16_t clock_sequence() const;
        std::uint64_t node() const;

        std::array<unsigned char, Uuid::size> bytes() const;
        bool is_nil() const;
        std::string to_string() const;

        std::uint32_t hash_code() const;
        // Unsigned comparison of high() then low().
        int compare(const Uuid& other) const;

    private:
        static Uuid from_unix_time(std::int64_t seconds, std::int64_t nanoseconds);

        std::uint64_t high_;
        std::uint64_t low_;
    };

    template<class Duration>
    Uuid::Uuid(Uuid::Version1, std::chrono::time_point<std::chrono::system_clock, Duration> time)
      : Uuid()
    {
        // Floor to whole seconds so that the sub second remainder is never negative.
        const auto since_epoch = time.time_since_epoch();
        const auto seconds = std::chrono::floor<std::chrono::seconds>(since_epoch);
        const auto nanoseconds = std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch - seconds);
        *this = Uuid::from_unix_time(seconds.count(), nanoseconds.count());
    }

    /* RFC 4122 Appendix C name space ids. */
    // Name string is a fully-qualified domain name.
    inline constexpr Uuid NameSpace_DNS{0x6ba7b8109dad11d1ULL, 0x80b400c04fd430c8ULL};
    // Name string is a URL.
    inline constexpr Uuid NameSpace_URL{0x6ba7b8119dad11d1ULL, 0x80b400c04fd430c8ULL};
    // Name string is an ISO OID.
    inline constexpr Uuid NameSpace_OID{0x6ba7b8129dad11d1ULL, 0x80b400c04fd430c8ULL};
    // Name string is an X.500 DN (in DER or a text output format).
    inline constexpr Uuid NameSpace_X500{0x6ba7b8149dad11d1ULL, 0x80b400c04fd430c8ULL};

    Uuid random_uuid();
    Uuid time_based_uuid();
    template<class Duration>
    Uuid time_based_uuid(std::chrono::time_point<std::chrono::system_clock, Duration> time){
        return Uuid(Uuid::v1, time);
    }
    Uuid md5_name_uuid(const Uuid& name_space, const std::string& name);
    Uuid md5_name_uuid(const Uuid& name_space, const std::vector<unsigned char>& name);
    Uuid sha1_name_uuid(const Uuid& name_space, const std::string& name);
    Uuid sha1_name_uuid(const Uuid& name_space, const std::vector<unsigned char>& name);
    Uuid from_string(const std::string& uuid);

    // Canonical 8-4-4-4-12 lower case hex.
    std::ostream& operator<<(std::ostream& os, const Uuid& uuid);
    // Sets failbit on a malformed token and leaves uuid untouched.
    std::istream& operator>>(std::istream& is, Uuid& uuid);
    bool operator==(const Uuid& lhs, const Uuid& rhs);
    bool operator!=(const Uuid& lhs, const Uuid& rhs);
    bool operator<(const Uuid& lhs, const Uuid& rhs);
    bool operator<=(const Uuid& lhs, const Uuid& rhs);
    bool operator>(const Uuid& lhs, const Uuid& rhs);
    bool operator>=(const Uuid& lhs, const Uuid& rhs);
}// UUID namespace

namespace std{
    template<>
    struct hash<UUID::Uuid>
    {
        std::size_t operator()(const UUID::Uuid& uuid) const { return uuid.hash_code(); }
    };
}
#endif
