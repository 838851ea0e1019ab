#include "base64.h"

#include <array>

namespace {

const char kBase64Chars[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "abcdefghijklmnopqrstuvwxyz"
    "0123456789+/";

std::array<int, 256> MakeDecodeTable() {
  std::array<int, 256> ret;
  ret.fill(-1);
  for (int i = 0; i < 64; i++) ret[(unsigned char)kBase64Chars[i]] = i;
  return ret;
}

} // namespace

std::string Base64Encode(const std::string& data) {
  std::string out;
  out.reserve((data.size() + 2) / 3 * 4);
  unsigned int val = 0;
  int valb = -6;
  for (unsigned char c : data) {
    val = ((val << 8) + c) & 0xffffff;
    valb += 8;
    while (valb >= 0) {
      out.push_back(kBase64Chars[(val >> valb) & 0x3F]);
      valb -= 6;
    }
  }
  if (valb > -6) out.push_back(kBase64Chars[((val << 8) >> (valb + 8)) & 0x3F]);
  while (out.size() % 4) out.push_back('=');
  return out;
}

bool Base64Decode(const std::string& str, std::string& data) {
  static const std::array<int, 256> kTable = MakeDecodeTable();
  data.clear();
  if (str.size() % 4) return false;
  data.reserve(str.size() / 4 * 3);
  unsigned int val = 0;
  int valb = -8;
  size_t pad = 0;
  for (unsigned char c : str) {
    if (c == '=') {
      if (++pad > 2) return false;
      continue;
    }
    if (pad) return false; // data after padding
    int x = kTable[c];
    if (x == -1) return false;
    val = ((val << 6) + x) & 0xffffff;
    valb += 6;
    if (valb >= 0) {
      data.push_back(char((val >> valb) & 0xFF));
      valb -= 8;
    }
  }
  return true;
}
