/**
 * @file qwenchat.hpp
 * @brief Main header for qwenchat
 *
 * C++ client for the Qwen chat web service.
 * Provides cookie-based sessions, conversation threading and a streaming
 * decoder that separates reasoning from answer content.
 */

#ifndef QWENCHAT_HPP
#define QWENCHAT_HPP

#include "qwenchat/types.hpp"
#include "qwenchat/errors.hpp"
#include "qwenchat/config.hpp"
#include "qwenchat/logging.hpp"
#include "qwenchat/credential_store.hpp"
#include "qwenchat/session_manager.hpp"
#include "qwenchat/conversation.hpp"
#include "qwenchat/request_builder.hpp"
#include "qwenchat/stream_decoder.hpp"
#include "qwenchat/transport.hpp"
#include "qwenchat/session.hpp"
#include "qwenchat/client.hpp"

namespace qwenchat {

/// Library version
constexpr const char* VERSION = "0.1.0";

} // namespace qwenchat

#endif // QWENCHAT_HPP
