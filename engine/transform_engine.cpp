#include "transform_engine.hpp"

const char* engineResultName(EngineResult result) {
    switch (result) {
        case EngineResult::Done: return "done";
        case EngineResult::Blocked: return "blocked";
        case EngineResult::Running: return "running";
        case EngineResult::IoError: return "io error";
        case EngineResult::SyntaxError: return "syntax error";
        case EngineResult::MemError: return "out of memory";
        case EngineResult::InputEnded: return "unexpected end of input";
        case EngineResult::BadMagic: return "bad magic number";
        case EngineResult::Unimplemented: return "unimplemented";
        case EngineResult::Corrupt: return "corrupt data";
        case EngineResult::InternalError: return "internal error";
        case EngineResult::ParamError: return "bad parameter";
    }
    return "unknown";
}
