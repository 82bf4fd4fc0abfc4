#include "uuid-random-tests.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <string>
#include <thread>

namespace tests{
    namespace {
        std::string hex(const std::vector<unsigned char>& bytes){
            std::ostringstream ss;
            for(unsigned char byte: bytes){
                ss << std::setfill('0') << std::setw(2) << std::hex << static_cast<std::uint16_t>(byte);
            }
            return ss.str();
        }

        std::vector<unsigned char> to_bytes(const std::string& str){
            return std::vector<unsigned char>(str.begin(), str.end());
        }
    }

    UuidRandomTests::UuidRandomTests(UuidRandomTests::Fill)
      : passed_{false}
    {
        if(!UUID::random::bytes(0).empty()){
            return;
        }
        std::vector<unsigned char> first = UUID::random::bytes(32);
        std::vector<unsigned char> second = UUID::random::bytes(32);
        if(first.size() != 32 || first == second){
            return;
        }
        if(std::all_of(first.begin(), first.end(), [](unsigned char c){ return c == 0; })){
            return;
        }
        // Larger than a single getrandom call is guaranteed to return.
        std::vector<unsigned char> large(4096, 0);
        UUID::random::fill(large.data(), large.size());
        if(std::all_of(large.end() - 64, large.end(), [](unsigned char c){ return c == 0; })){
            return;
        }
        passed_ = true;
    }

    UuidRandomTests::UuidRandomTests(UuidRandomTests::State)
      : passed_{false}
    {
        const UUID::random::GenerationState& first = UUID::random::state();
        const UUID::random::GenerationState& second = UUID::random::state();
        if(&first != &second){
            return;
        }
        if(first.clock_sequence != second.clock_sequence || first.node != second.node){
            return;
        }
        if(first.node > 0x0000ffffffffffffULL){
            return;
        }
        passed_ = true;
    }

    UuidRandomTests::UuidRandomTests(UuidRandomTests::ConcurrentState)
      : passed_{false}
    {
        constexpr std::size_t num_threads = 8;
        std::vector<const UUID::random::GenerationState*> states(num_threads, nullptr);
        std::vector<std::thread> threads;
        for(std::size_t i=0; i < num_threads; ++i){
            threads.emplace_back([&states, i](){
                states[i] = &UUID::random::state();
            });
        }
        for(auto& thread: threads){
            thread.join();
        }
        for(const UUID::random::GenerationState* state: states){
            if(state != &UUID::random::state()){
                return;
            }
        }
        passed_ = true;
    }

    UuidRandomTests::UuidRandomTests(UuidRandomTests::Md5)
      : passed_{false}
    {
        std::vector<unsigned char> digest = UUID::digest::md5(to_bytes(""));
        if(digest.size() != 16 || hex(digest) != "d41d8cd98f00b204e9800998ecf8427e"){
            return;
        }
        if(hex(UUID::digest::md5(to_bytes("abc"))) != "900150983cd24fb0d6963f7d28e17f72"){
            return;
        }
        passed_ = true;
    }

    UuidRandomTests::UuidRandomTests(UuidRandomTests::Sha1)
      : passed_{false}
    {
        std::vector<unsigned char> digest = UUID::digest::sha1(to_bytes(""));
        if(digest.size() != 20 || hex(digest) != "da39a3ee5e6b4b0d3255bfef95601890afd80709"){
            return;
        }
        if(hex(UUID::digest::sha1(to_bytes("abc"))) != "a9993e364706816aba3e25717850c26c9cd0d89d"){
            return;
        }
        passed_ = true;
    }
}
