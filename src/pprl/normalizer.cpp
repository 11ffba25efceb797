#include "normalizer.h"

#include <emp-tool/emp-tool.h>

#include <boost/format.hpp>
#include <set>

#include "errors.h"

namespace pprl {

namespace {

bool isAsciiSpace(unsigned char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

bool isValidUtf8(std::string_view str) {
  size_t i = 0;
  while (i < str.size()) {
    auto c = static_cast<unsigned char>(str[i]);
    size_t len = 0;
    uint32_t cp = 0;
    if (c < 0x80) {
      ++i;
      continue;
    } else if ((c & 0xe0) == 0xc0) {
      len = 2;
      cp = c & 0x1f;
    } else if ((c & 0xf0) == 0xe0) {
      len = 3;
      cp = c & 0x0f;
    } else if ((c & 0xf8) == 0xf0) {
      len = 4;
      cp = c & 0x07;
    } else {
      return false;
    }
    if (i + len > str.size()) {
      return false;
    }
    for (size_t k = 1; k < len; ++k) {
      auto cc = static_cast<unsigned char>(str[i + k]);
      if ((cc & 0xc0) != 0x80) {
        return false;
      }
      cp = (cp << 6) | (cc & 0x3f);
    }
    // Overlong encodings, surrogates and values beyond U+10FFFF.
    if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) ||
        (len == 4 && cp < 0x10000) || cp > 0x10ffff ||
        (cp >= 0xd800 && cp <= 0xdfff)) {
      return false;
    }
    i += len;
  }
  return true;
}

}  // namespace

IdentityNormalizer::IdentityNormalizer(NormalizerOptions opts) : opts_(std::move(opts)) {}

std::string IdentityNormalizer::canonicalize(std::string_view raw) const {
  size_t begin = 0;
  size_t end = raw.size();
  while (begin < end && isAsciiSpace(raw[begin])) {
    ++begin;
  }
  while (end > begin && isAsciiSpace(raw[end - 1])) {
    --end;
  }
  std::string canon(raw.substr(begin, end - begin));

  if (canon.empty()) {
    throw InvalidInputError("Empty identifier.");
  }
  for (unsigned char c : canon) {
    if (c < 0x20 || c == 0x7f) {
      throw InvalidInputError("Identifier contains a control character.");
    }
  }
  if (!isValidUtf8(canon)) {
    throw InvalidInputError("Identifier is not valid UTF-8.");
  }

  if (opts_.case_insensitive) {
    for (auto& c : canon) {
      if (c >= 'A' && c <= 'Z') {
        c = static_cast<char>(c - 'A' + 'a');
      }
    }
  }
  return canon;
}

Token IdentityNormalizer::normalize(std::string_view raw) const {
  auto canon = canonicalize(raw);

  // digest = SHA-256(domain || 0x00 || canonical identifier)
  std::string msg;
  msg.reserve(opts_.token_domain.size() + 1 + canon.size());
  msg.append(opts_.token_domain);
  msg.push_back('\0');
  msg.append(canon);

  uint8_t digest[emp::Hash::DIGEST_SIZE];
  emp::Hash::hash_once(digest, msg.data(), static_cast<int>(msg.size()));
  return Token::fromDigest(digest);
}

std::vector<Token> IdentityNormalizer::normalizeAll(const std::vector<std::string>& raws,
                                                    InvalidRecordPolicy policy,
                                                    bool deduplicate,
                                                    NormalizationReport* report) const {
  NormalizationReport stats;
  std::vector<Token> tokens;
  tokens.reserve(raws.size());
  std::set<Token> seen;

  for (size_t i = 0; i < raws.size(); ++i) {
    try {
      auto tok = normalize(raws[i]);
      if (deduplicate && !seen.insert(tok).second) {
        stats.duplicates_removed++;
        continue;
      }
      tokens.push_back(tok);
      stats.accepted++;
    } catch (const InvalidInputError& ex) {
      if (policy == InvalidRecordPolicy::kReject) {
        throw InvalidInputError(
            boost::str(boost::format("Record %1%: %2%") % i % ex.what()));
      }
      stats.skipped++;
    }
  }

  if (report != nullptr) {
    *report = stats;
  }
  return tokens;
}

};  // namespace pprl
