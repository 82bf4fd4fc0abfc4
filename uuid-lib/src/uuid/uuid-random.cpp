#include "uuid-random.hpp"
#include <cerrno>
#include <iostream>
#include <system_error>
#include <sys/random.h>

namespace UUID{
namespace random{
    namespace {
        GenerationState make_state(){
            std::vector<unsigned char> seed = bytes(14);
            GenerationState state{0, 0};
            for(std::size_t i=0; i < 8; ++i){
                state.clock_sequence = (state.clock_sequence << 8) | seed[i];
            }
            for(std::size_t i=8; i < seed.size(); ++i){
                state.node = (state.node << 8) | seed[i];
            }
            return state;
        }
    }

    void fill(unsigned char* buf, std::size_t len){
        std::size_t filled = 0;
        while(filled < len){
            // Reads of up to 256 bytes are never short once the entropy
            // pool is initialized, larger reads and signals can be.
            ssize_t length = getrandom(buf + filled, len - filled, 0);
            if(length == -1){
                int error = errno;
                if(error == EINTR){
                    continue;
                }
                std::cerr << "uuid-random.cpp:34:getrandom failed:" << std::make_error_code(std::errc(error)).message() << std::endl;
                throw std::system_error(error, std::generic_category(), "getrandom");
            }
            filled += static_cast<std::size_t>(length);
        }
    }

    std::vector<unsigned char> bytes(std::size_t len){
        std::vector<unsigned char> buf(len);
        fill(buf.data(), buf.size());
        return buf;
    }

    const GenerationState& state(){
        // Static local initialization is thread safe and happens exactly once.
        static const GenerationState generation_state = make_state();
        return generation_state;
    }
}// namespace random
}// namespace UUID
