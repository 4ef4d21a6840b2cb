#pragma once

#include <cstdio>
#include <cstdlib>

#define LOGI(fmt, ...) do { fprintf(stdout, "[INFO] " fmt "\n", ##__VA_ARGS__); } while(0)
#define LOGW(fmt, ...) do { fprintf(stdout, "[WARN] " fmt "\n", ##__VA_ARGS__); } while(0)
#define LOGE(fmt, ...) do { fprintf(stderr, "[ERROR] " fmt "\n", ##__VA_ARGS__); } while(0)

// Broken upstream contract (e.g. an entity kind without a decoded mask). Not recoverable.
#define RONIN_REQUIRE(cond, fmt, ...) do { if(!(cond)) { LOGE("contract violated: " fmt, ##__VA_ARGS__); std::abort(); } } while(0)
