#include "../include/cloudburst/util.hpp"
#include <cstdio>
#include <mutex>
#include <random>

namespace cloudburst {
AuthToken
GenerateAuthToken(std::size_t length)
{
  static const char alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
                                 "abcdefghijklmnopqrstuvwxyz"
                                 "0123456789";
  static std::mutex rngMutex;
  static std::random_device dev;
  static std::mt19937_64 rng(dev());
  std::uniform_int_distribution<std::size_t> dist(0, sizeof(alphabet) - 2);

  AuthToken token;
  token.reserve(length);

  std::unique_lock<std::mutex> lock(rngMutex);
  for(std::size_t i = 0; i < length; ++i) {
    token += alphabet[dist(rng)];
  }
  return token;
}

std::string
DurationPrettyPrint(Duration d)
{
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.3fs", d.count());
  return buf;
}
}
