#include "uuid-digest.hpp"
#include <iostream>
#include <memory>
#include <new>
#include <stdexcept>
#include <string>
#include <openssl/err.h>
#include <openssl/evp.h>

namespace UUID{
namespace digest{
    namespace {
        struct MdDeleter
        {
            void operator()(EVP_MD* md) const { EVP_MD_free(md); }
        };
        struct MdCtxDeleter
        {
            void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
        };
        using md_ptr = std::unique_ptr<EVP_MD, MdDeleter>;
        using md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

        std::string openssl_error(){
            char buf[256] = {};
            ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
            return std::string(buf);
        }

        md_ptr fetch(const char* algorithm){
            md_ptr md(EVP_MD_fetch(nullptr, algorithm, nullptr));
            if(!md){
                std::cerr << "uuid-digest.cpp:33:EVP_MD_fetch " << algorithm << " failed:" << openssl_error() << std::endl;
                throw std::runtime_error(std::string(algorithm) + " hashing is not supported.");
            }
            return md;
        }

        std::vector<unsigned char> compute(const EVP_MD* md, const std::vector<unsigned char>& data){
            md_ctx_ptr ctx(EVP_MD_CTX_new());
            if(!ctx){
                throw std::bad_alloc();
            }
            unsigned char buf[EVP_MAX_MD_SIZE] = {};
            unsigned int length = 0;
            if(EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1
                || EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1
                || EVP_DigestFinal_ex(ctx.get(), buf, &length) != 1)
            {
                std::cerr << "uuid-digest.cpp:50:" << EVP_MD_get0_name(md) << " digest failed:" << openssl_error() << std::endl;
                throw std::runtime_error(std::string(EVP_MD_get0_name(md)) + " digest failed.");
            }
            return std::vector<unsigned char>(buf, buf + length);
        }
    }

    std::vector<unsigned char> md5(const std::vector<unsigned char>& data){
        // Fetched once. A failed fetch is retried, and fails again, on the next call.
        static const md_ptr md = fetch("MD5");
        return compute(md.get(), data);
    }

    std::vector<unsigned char> sha1(const std::vector<unsigned char>& data){
        static const md_ptr md = fetch("SHA1");
        return compute(md.get(), data);
    }
}// namespace digest
}// namespace UUID
