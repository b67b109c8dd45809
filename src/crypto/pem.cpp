#include "crypto/pem.hpp"
#include "crypto/openssl_types.hpp"

#include <openssl/pem.h>

#include <format>
#include <stdexcept>

namespace kafkasec {

namespace {

// Owns the three buffers PEM_read_bio allocates
struct PemReadBuffers {
    char* name = nullptr;
    char* header = nullptr;
    unsigned char* data = nullptr;
    long len = 0;

    ~PemReadBuffers() {
        OPENSSL_free(name);
        OPENSSL_free(header);
        OPENSSL_free(data);
    }

    PemBlock to_block() const {
        PemBlock block;
        block.type = name ? name : "";
        block.headers = header ? header : "";
        if (data && len > 0) {
            block.bytes.assign(reinterpret_cast<const char*>(data), static_cast<size_t>(len));
        }
        return block;
    }
};

enum class ReadStatus { BLOCK, END, MALFORMED };

ReadStatus read_next(BIO* bio, PemBlock& out) {
    ERR_clear_error();
    PemReadBuffers buf;
    if (PEM_read_bio(bio, &buf.name, &buf.header, &buf.data, &buf.len) == 1) {
        out = buf.to_block();
        return ReadStatus::BLOCK;
    }
    // No further BEGIN line is the normal end of input
    const unsigned long err = ERR_peek_last_error();
    if (ERR_GET_LIB(err) == ERR_LIB_PEM && ERR_GET_REASON(err) == PEM_R_NO_START_LINE) {
        ERR_clear_error();
        return ReadStatus::END;
    }
    return ReadStatus::MALFORMED;
}

} // anonymous namespace

std::optional<PemBlock> decode_pem(std::string_view data) {
    if (data.empty()) return std::nullopt;

    const auto bio = make_mem_bio(data);
    if (!bio) return std::nullopt;

    PemBlock block;
    if (read_next(bio.get(), block) != ReadStatus::BLOCK) {
        ERR_clear_error();
        return std::nullopt;
    }
    return block;
}

Result<std::vector<PemBlock>> decode_all_pem(std::string_view data) {
    std::vector<PemBlock> blocks;
    if (data.empty()) return Result<std::vector<PemBlock>>::ok(std::move(blocks));

    const auto bio = make_mem_bio(data);
    if (!bio) {
        return Result<std::vector<PemBlock>>::error(ErrorCategory::INTERNAL_ERROR,
            "failed to allocate memory BIO");
    }

    while (true) {
        PemBlock block;
        switch (read_next(bio.get(), block)) {
            case ReadStatus::BLOCK:
                blocks.push_back(std::move(block));
                break;
            case ReadStatus::END:
                return Result<std::vector<PemBlock>>::ok(std::move(blocks));
            case ReadStatus::MALFORMED:
                return Result<std::vector<PemBlock>>::error(ErrorCategory::PARSE_ERROR,
                    std::format("malformed PEM block #{}: {}", blocks.size() + 1,
                        openssl_error_string()));
        }
    }
}

std::string encode_pem(const PemBlock& block) {
    BioPtr bio(BIO_new(BIO_s_mem()));
    if (!bio) {
        throw std::runtime_error("failed to allocate memory BIO");
    }

    const int written = PEM_write_bio(bio.get(),
        block.type.c_str(),
        block.headers.c_str(),
        reinterpret_cast<const unsigned char*>(block.bytes.data()),
        static_cast<long>(block.bytes.size()));
    if (written <= 0) {
        throw std::runtime_error(std::format("PEM_write_bio failed: {}", openssl_error_string()));
    }

    char* out = nullptr;
    const long out_len = BIO_get_mem_data(bio.get(), &out);
    return std::string(out, static_cast<size_t>(out_len));
}

} // namespace kafkasec
