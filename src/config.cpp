#include "config.hpp"

namespace runner {
using namespace std;

string DOCKER_SOCKET = "/var/run/docker.sock";
string DOCKER_API_VERSION = "v1.41";
string IMAGE_PREFIX = "runner-";
int64_t MEMORY_LIMIT = 256 * 1024 * 1024;  // 256M
int64_t CPU_QUOTA = 50000;                 // 0.5 core
int64_t CPU_PERIOD = 100000;
string WORKSPACE_MOUNT = "/workspace";
string SCRATCH_MOUNT = "/sandbox";
int64_t SCRATCH_SIZE = 64 * 1024 * 1024;  // 64M
chrono::milliseconds DEFAULT_TIMEOUT{5000};
chrono::milliseconds MAX_TIMEOUT{300000};
int64_t OUTPUT_LIMIT = 16 * 1024 * 1024;  // 16M
chrono::milliseconds LOG_GRACE{100};
chrono::milliseconds KILL_GRACE{2000};
chrono::milliseconds READY_TIMEOUT{10000};
filesystem::path TEMP_DIR;

}  // namespace runner
