#ifndef UUID_DIGEST_HPP
#define UUID_DIGEST_HPP
#include <vector>
namespace UUID{
namespace digest{
    // One shot digests. A provider that does not supply the algorithm is a
    // configuration fault: std::runtime_error on every call.
    std::vector<unsigned char> md5(const std::vector<unsigned char>& data); // 16 bytes.
    std::vector<unsigned char> sha1(const std::vector<unsigned char>& data); // 20 bytes.
}// namespace digest
}// namespace UUID
#endif
