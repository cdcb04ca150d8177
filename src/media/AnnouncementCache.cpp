// Repository: Jukebox-controller
// Component: Announcement Cache
// Purpose: Content-addressed store of synthesized speech keyed by SHA-256 of the text.
// Copyright (c) 2026 Jukebox

#include "jukebox/media/AnnouncementCache.hpp"

#include <openssl/evp.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <memory>
#include <stdexcept>

#include "jukebox/util/Logger.hpp"

namespace jukebox::media {

namespace {

// mkdir -p
bool MakeDirs(const std::string& path) {
  if (path.empty()) return false;
  std::string partial;
  size_t pos = 0;
  while (pos != std::string::npos) {
    pos = path.find('/', pos + 1);
    partial = path.substr(0, pos);
    if (partial.empty()) continue;
    if (mkdir(partial.c_str(), 0755) != 0 && errno != EEXIST) return false;
  }
  return true;
}

}  // namespace

AnnouncementCache::AnnouncementCache(std::string cache_dir) : cache_dir_(std::move(cache_dir)) {
  if (!MakeDirs(cache_dir_)) {
    util::Logger::Warn("[AnnouncementCache] cannot create " + cache_dir_ + ": " +
                       std::strerror(errno));
  }
}

std::string AnnouncementCache::KeyFor(const std::string& text) {
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(),
                                                              &EVP_MD_CTX_free);
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), text.data(), text.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
    throw std::runtime_error("SHA-256 digest failed");
  }

  static const char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(digest_len * 2);
  for (unsigned int i = 0; i < digest_len; ++i) {
    out += kHex[digest[i] >> 4];
    out += kHex[digest[i] & 0x0F];
  }
  return out;
}

std::string AnnouncementCache::PathFor(const std::string& text) const {
  return cache_dir_ + "/" + KeyFor(text) + ".wav";
}

bool AnnouncementCache::Contains(const std::string& text) const {
  struct stat st;
  return stat(PathFor(text).c_str(), &st) == 0 && S_ISREG(st.st_mode) && st.st_size > 0;
}

void AnnouncementCache::Evict(const std::string& text) const {
  unlink(PathFor(text).c_str());
}

}  // namespace jukebox::media
