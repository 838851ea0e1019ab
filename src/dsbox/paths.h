#ifndef DSBOX_PATHS_H_
#define DSBOX_PATHS_H_

#include <string>
#include <dsbox/paths.h>

// for atomic replacement: write here, then rename onto path
fs::path PartialFile(const fs::path& path);

// helper executable that runs cjail outside of our (multithreaded) process
fs::path JailHelperPath();

// one request directory per Execute() in shared mode
fs::path SharedRequestDir(const fs::path& data_dir, const std::string& request_id);

#endif  // DSBOX_PATHS_H_
