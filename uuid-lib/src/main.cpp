#include "../tests/uuid/uuid-tests.hpp"
#include "../tests/uuid/uuid-codec-tests.hpp"
#include "../tests/uuid/uuid-generators-tests.hpp"
#include "../tests/uuid/uuid-random-tests.hpp"
#include "../tests/uuid/uuid-boost-tests.hpp"
#include <iostream>
#include <string>

namespace {
    std::size_t failures = 0;

    // Runs one test case. An exception escaping a test counts as a failure.
    template<class Test, class Tag>
    void run(const std::string& suite, std::size_t& test_num, Tag tag){
        bool passed = false;
        try{
            Test test(tag);
            passed = static_cast<bool>(test);
        } catch(const std::exception& e){
            std::cerr << suite << " test " << test_num << " threw:" << e.what() << std::endl;
        }
        if(passed){
            std::cout << suite << " test " << test_num << " passed." << std::endl;
        } else {
            std::cerr << suite << " test " << test_num << " failed." << std::endl;
            ++failures;
        }
        ++test_num;
    }
}

int main(int argc, char* argv[]){
    {
        // UUID value tests.
        using namespace tests;
        std::size_t test_num = 1;
        run<UuidTests>("Uuid", test_num, UuidTests::test_default_constructor);
        run<UuidTests>("Uuid", test_num, UuidTests::test_byte_array);
        run<UuidTests>("Uuid", test_num, UuidTests::test_invalid_length);
        run<UuidTests>("Uuid", test_num, UuidTests::test_variant_overwrite);
        run<UuidTests>("Uuid", test_num, UuidTests::test_high_low);
        run<UuidTests>("Uuid", test_num, UuidTests::test_variants);
        run<UuidTests>("Uuid", test_num, UuidTests::test_versions);
        run<UuidTests>("Uuid", test_num, UuidTests::test_fields);
        run<UuidTests>("Uuid", test_num, UuidTests::test_ordering);
        run<UuidTests>("Uuid", test_num, UuidTests::test_hash);
    }
    {
        // String codec tests.
        using namespace tests;
        std::size_t test_num = 1;
        run<UuidCodecTests>("Uuid codec", test_num, UuidCodecTests::test_from_string);
        run<UuidCodecTests>("Uuid codec", test_num, UuidCodecTests::test_to_string);
        run<UuidCodecTests>("Uuid codec", test_num, UuidCodecTests::test_round_trip);
        run<UuidCodecTests>("Uuid codec", test_num, UuidCodecTests::test_malformed);
        run<UuidCodecTests>("Uuid codec", test_num, UuidCodecTests::test_stream_insertion);
        run<UuidCodecTests>("Uuid codec", test_num, UuidCodecTests::test_stream_extraction);
        run<UuidCodecTests>("Uuid codec", test_num, UuidCodecTests::test_string_order);
    }
    {
        // Generator tests.
        using namespace tests;
        std::size_t test_num = 1;
        run<UuidGeneratorsTests>("Uuid generators", test_num, UuidGeneratorsTests::test_random);
        run<UuidGeneratorsTests>("Uuid generators", test_num, UuidGeneratorsTests::test_time_based);
        run<UuidGeneratorsTests>("Uuid generators", test_num, UuidGeneratorsTests::test_time_based_epochs);
        run<UuidGeneratorsTests>("Uuid generators", test_num, UuidGeneratorsTests::test_time_based_now);
        run<UuidGeneratorsTests>("Uuid generators", test_num, UuidGeneratorsTests::test_md5_name);
        run<UuidGeneratorsTests>("Uuid generators", test_num, UuidGeneratorsTests::test_sha1_name);
    }
    {
        // Random source and digest tests.
        using namespace tests;
        std::size_t test_num = 1;
        run<UuidRandomTests>("Uuid random", test_num, UuidRandomTests::test_fill);
        run<UuidRandomTests>("Uuid random", test_num, UuidRandomTests::test_state);
        run<UuidRandomTests>("Uuid random", test_num, UuidRandomTests::test_concurrent_state);
        run<UuidRandomTests>("Uuid random", test_num, UuidRandomTests::test_md5);
        run<UuidRandomTests>("Uuid random", test_num, UuidRandomTests::test_sha1);
    }
    {
        // Boost.UUID interop tests.
        using namespace tests;
        std::size_t test_num = 1;
        run<UuidBoostTests>("Uuid boost", test_num, UuidBoostTests::test_round_trip);
        run<UuidBoostTests>("Uuid boost", test_num, UuidBoostTests::test_name_spaces);
        run<UuidBoostTests>("Uuid boost", test_num, UuidBoostTests::test_name_generator);
    }
    return (failures == 0) ? 0 : 1;
}
