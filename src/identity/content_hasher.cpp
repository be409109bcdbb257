#include "identity/content_hasher.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <openssl/evp.h>

#include <memory>
#include <stdexcept>

namespace goldminer {

std::string ContentHasher::canonical_form(const IdentityFields& fields) {
    const std::string date = utils::collapse_whitespace(fields.resolved_date);
    const std::string account = utils::collapse_whitespace(fields.account_id);
    if (date.empty()) {
        throw InvariantViolation("content hash requested without resolved_date");
    }
    if (account.empty()) {
        throw InvariantViolation("content hash requested without account_id");
    }

    std::string input;
    input += date;
    input += '|';
    input += utils::collapse_whitespace(fields.amount.value_or(""));
    input += '|';
    input += utils::collapse_whitespace(fields.payee.value_or(""));
    input += '|';
    input += account;
    input += '|';
    input += transaction_state_to_string(fields.state);
    return input;
}

std::string ContentHasher::sha256_hex(const std::string& input) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx) throw std::runtime_error("EVP_MD_CTX_new failed");

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), input.data(), input.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), hash, &hash_len) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }
    return utils::bytes_to_hex(hash, hash_len);
}

std::string ContentHasher::compute(const IdentityFields& fields) {
    return sha256_hex(canonical_form(fields));
}

IdentityFields ContentHasher::identity_of(const TransactionRecord& record) {
    return IdentityFields{
        record.resolved_date,
        record.fields.amount,
        record.fields.payee,
        record.account.account_id,
        record.transaction_state,
    };
}

std::string ContentHasher::compute(const TransactionRecord& record) {
    return compute(identity_of(record));
}

} // namespace goldminer
