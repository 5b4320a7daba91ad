#ifdef EMSCRIPTEN
#include <emscripten/bind.h>
#include <emscripten/emscripten.h>
#endif

#include "restore/reconstruct/session.h"

#ifdef EMSCRIPTEN
using restore::ReconstructSession;

EMSCRIPTEN_BINDINGS(restore_module) {
    emscripten::class_<ReconstructSession>("ReconstructSession")
        .constructor<>()
        .function("clear", &ReconstructSession::clear)
        .function("allocBytes", &ReconstructSession::allocBytes)
        .function("freeBytes", &ReconstructSession::freeBytes)
        .function("registerFont", &ReconstructSession::registerFont)
        .function("setViewportCenter", &ReconstructSession::setViewportCenter)
        .function("reconstructJson", &ReconstructSession::reconstructJson)
        .function("lastRootId", &ReconstructSession::lastRootId)
        .function("exportJson", &ReconstructSession::exportJson)
        .function("nodeCount", &ReconstructSession::nodeCount);
}
#endif
