#ifndef RUNBOX_PROTOCOL_H
#define RUNBOX_PROTOCOL_H

#include "session_manager.h"
#include "shim.h"
#include "stream.h"

namespace runbox {

// Body of POST /execute. Accepts the project form
//   {"sessionId", "language", "files": [{"name", "content"}], "entryFile",
//    "input"?, "dependencies"?: {name: version}}
// and the single-file form {"sessionId", "language", "code", "input"?}.
// Malformed bodies yield Errc::kInvalidBundle; the single-file form needs the
// language to name its file and yields Errc::kUnsupportedLanguage.
ErrorCode ParseExecuteRequest(StringView body, ExecuteRequest& request);

// Body of POST /input: {"sessionId", "input"}.
ErrorCode ParseInputRequest(StringView body,
                            String& session_id,
                            String& input);

// Body of POST /stop: {"sessionId"}.
ErrorCode ParseStopRequest(StringView body, String& session_id);

// One Server-Sent Events frame: data: {"type":...,"data":...}
String EncodeEvent(const Event& event);

// SSE comment frame that keeps idle connections open.
String EncodeKeepAlive();

// {"success":true} or {"success":false,"error":...}
String EncodeResult(const ErrorCode& ec);

}  // namespace runbox

#endif  // RUNBOX_PROTOCOL_H
