#ifndef _VfsEmu_VfsEmu_h_
#define _VfsEmu_VfsEmu_h_

// Standard library includes
#include <cstdint>
#include <cstring>
#include <cstdlib>
#include <cstdio>
#include <cctype>
#include <cstddef>
#include <algorithm>
#include <array>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include <fstream>
#include <filesystem>
#include <iomanip>
#include <system_error>

// System includes
#include <termios.h>
#include <unistd.h>
#include <signal.h>

// External library includes
#include <blake3.h>

#include "vfs_common.h"
#include "utils.h"
#include "vfs_path.h"
#include "content_codec.h"
#include "vfs_core.h"
#include "vfs_source.h"
#include "command.h"
#include "shell.h"

#endif
