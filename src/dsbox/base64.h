#ifndef DSBOX_BASE64_H_
#define DSBOX_BASE64_H_

#include <string>

// standard alphabet with padding
std::string Base64Encode(const std::string& data);
// return false on characters outside the alphabet or bad padding
bool Base64Decode(const std::string& str, std::string& data);

#endif  // DSBOX_BASE64_H_
