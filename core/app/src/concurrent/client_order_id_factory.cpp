#include "recon/concurrent/client_order_id_factory.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace recon {

namespace {

// "ETH-USDC" -> "ETHUSDC" with each half cut to four characters.
std::string compactPair(const std::string& trading_pair) {
  const auto dash = trading_pair.find('-');
  if (dash == std::string::npos) {
    return trading_pair.substr(0, 8);
  }
  return trading_pair.substr(0, std::min<std::size_t>(dash, 4)) +
         trading_pair.substr(dash + 1, 4);
}

}  // namespace

ClientOrderIdFactory::ClientOrderIdFactory(std::string broker_id,
                                           std::size_t max_len,
                                           std::uint64_t first_nonce)
    : broker_id_(std::move(broker_id)),
      max_len_(max_len),
      nonce_(first_nonce) {}

std::string ClientOrderIdFactory::next(domain::Side side,
                                       const std::string& trading_pair) {
  const std::uint64_t nonce = nonce_.fetch_add(1, std::memory_order_relaxed);
  return md5Hex(rawId(side, trading_pair, nonce));
}

std::string ClientOrderIdFactory::rawId(domain::Side side,
                                        const std::string& trading_pair,
                                        std::uint64_t nonce) const {
  std::string raw = broker_id_;
  raw += (side == domain::Side::Buy) ? 'B' : 'S';
  raw += compactPair(trading_pair);

  const std::string nonce_str = std::to_string(nonce);
  // Keep the nonce whole: trim the prefix part when the id is too long so
  // distinct nonces never collapse into the same raw id.
  if (raw.size() + nonce_str.size() > max_len_ && max_len_ > nonce_str.size()) {
    raw.resize(max_len_ - nonce_str.size());
  }
  return raw + nonce_str;
}

std::string ClientOrderIdFactory::md5Hex(const std::string& input) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int len = 0;

  if (EVP_Digest(input.data(), input.size(), digest, &len, EVP_md5(),
                 nullptr) != 1) {
    throw std::runtime_error("Failed to compute MD5 digest for client order id");
  }

  std::ostringstream oss;
  oss << "0x";
  for (unsigned int i = 0; i < len; ++i) {
    oss << std::hex << std::setfill('0') << std::setw(2)
        << static_cast<int>(digest[i]);
  }
  return oss.str();
}

}  // namespace recon
