#include "sandbox/driver.hpp"

namespace scriptbox::sandbox {
namespace {

std::string BuildDriverSource() {
    std::string source;
    source += "import json\n";
    source += "import os\n";
    source += "import sys\n";
    source += "import traceback\n";
    source += "import types\n";
    source += "\n";
    source += "RESULT_FD = " + std::to_string(kResultChannelFd) + "\n";
    source += "SCRIPT_NAME = \"" + std::string(kScriptFileName) + "\"\n";
    source += "MODULE_NAME = \"" + std::string(kScriptModuleName) + "\"\n";
    source += "EXIT_EXCEPTION = " + std::to_string(kDriverExitException) + "\n";
    source += "EXIT_COMPILE_ERROR = " + std::to_string(kDriverExitCompileError) + "\n";
    source += "EXIT_NOT_SERIALIZABLE = " + std::to_string(kDriverExitNotSerializable) + "\n";
    source += "EXIT_NOT_CALLABLE = " + std::to_string(kDriverExitNotCallable) + "\n";
    source += R"PY(

def _flush():
    for stream in (sys.stdout, sys.stderr):
        try:
            stream.flush()
        except Exception:
            pass


def _report(exc):
    tb = exc.__traceback__
    while tb is not None and tb.tb_frame.f_code.co_filename != SCRIPT_NAME:
        tb = tb.tb_next
    traceback.print_exception(type(exc), exc, tb)


def _write_result(channel, payload):
    # Drop anything the script wrote to the channel while main() ran.
    os.ftruncate(channel, 0)
    os.lseek(channel, 0, os.SEEK_SET)
    data = payload.encode("utf-8")
    while data:
        written = os.write(channel, data)
        data = data[written:]


def _run():
    # Private handle: the script closing fd 3 does not take the channel away.
    channel = os.dup(RESULT_FD)
    path = os.path.join(os.path.dirname(os.path.abspath(__file__)), SCRIPT_NAME)
    with open(path, encoding="utf-8") as handle:
        source = handle.read()
    try:
        code = compile(source, SCRIPT_NAME, "exec")
    except (SyntaxError, ValueError) as exc:
        traceback.print_exception(type(exc), exc, None)
        _flush()
        return EXIT_COMPILE_ERROR

    module = types.ModuleType(MODULE_NAME)
    module.__file__ = SCRIPT_NAME
    sys.modules[MODULE_NAME] = module
    try:
        exec(code, module.__dict__)
        entry = module.__dict__.get("main")
        if not callable(entry):
            sys.stderr.write("TypeError: main is not callable\n")
            return EXIT_NOT_CALLABLE
        result = entry()
    except SystemExit as exc:
        sys.stderr.write("SystemExit: %s\n" % (exc.code,))
        return EXIT_EXCEPTION
    except Exception as exc:
        _report(exc)
        return EXIT_EXCEPTION
    finally:
        _flush()
    try:
        payload = json.dumps(result, allow_nan=False, ensure_ascii=False)
    except (TypeError, ValueError) as exc:
        sys.stderr.write("TypeError: main() returned a value that is not JSON serializable: %s\n" % exc)
        return EXIT_NOT_SERIALIZABLE
    _write_result(channel, payload)
    os.close(channel)
    return 0


if __name__ == "__main__":
    status = _run()
    _flush()
    sys.exit(status)
)PY";
    return source;
}

}  // namespace

const std::string& DriverSource() {
    static const std::string source = BuildDriverSource();
    return source;
}

std::vector<std::string> InterpreterArgs(const std::filesystem::path& driver_path) {
    // -I: no user site, no PYTHON* variables, script dir not on sys.path.
    // -B: no .pyc files in the read-only driver directory.
    return {"-I", "-B", driver_path.string()};
}

}  // namespace scriptbox::sandbox
