#ifndef UUID_CODEC_TESTS_HPP
#define UUID_CODEC_TESTS_HPP
#include "../../src/uuid/uuid.hpp"
namespace tests{
    class UuidCodecTests
    {
    public:
        constexpr static struct FromString{} test_from_string{};
        constexpr static struct ToString{} test_to_string{};
        constexpr static struct RoundTrip{} test_round_trip{};
        constexpr static struct Malformed{} test_malformed{};
        constexpr static struct StreamInsertion{} test_stream_insertion{};
        constexpr static struct StreamExtraction{} test_stream_extraction{};
        constexpr static struct StringOrder{} test_string_order{};

        explicit UuidCodecTests(FromString);
        explicit UuidCodecTests(ToString);
        explicit UuidCodecTests(RoundTrip);
        explicit UuidCodecTests(Malformed);
        explicit UuidCodecTests(StreamInsertion);
        explicit UuidCodecTests(StreamExtraction);
        explicit UuidCodecTests(StringOrder);

        operator bool(){ return passed_; }
    private:
        bool passed_;
    };
}
#endif
