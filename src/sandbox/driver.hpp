#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace scriptbox::sandbox {

// File descriptor the driver writes the serialized return value to. Stdout
// and stderr stay with the script.
inline constexpr int kResultChannelFd = 3;

inline constexpr const char* kDriverFileName = "driver.py";
inline constexpr const char* kScriptFileName = "script.py";
// Module the script runs as; registered in sys.modules.
inline constexpr const char* kScriptModuleName = "__script__";

// Driver exit codes. Anything else comes from the script or the interpreter.
// SystemExit raised by the script is reported as kDriverExitException.
inline constexpr int kDriverExitException = 1;
// script.py does not compile.
inline constexpr int kDriverExitCompileError = 2;
inline constexpr int kDriverExitNotSerializable = 3;
inline constexpr int kDriverExitNotCallable = 4;

// Used by the rlimit backend when the child cannot apply its limits.
inline constexpr int kChildSetupFailureExit = 125;

// Python program that loads script.py from its own directory, calls main()
// and writes json.dumps(result) to kResultChannelFd once main() returned.
const std::string& DriverSource();

std::vector<std::string> InterpreterArgs(const std::filesystem::path& driver_path);

}  // namespace scriptbox::sandbox
