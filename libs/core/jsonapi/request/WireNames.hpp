#pragma once

namespace Tuner::wire {

// Query argument and body field names used on the wire.
inline constexpr const char* kMethod           = "method";
inline constexpr const char* kAuthToken        = "auth_token";
inline constexpr const char* kPartnerId        = "partner_id";
inline constexpr const char* kUserId           = "user_id";

// Reserved body keys injected from the session; callers must not supply them.
inline constexpr const char* kPartnerAuthToken = "partnerAuthToken";
inline constexpr const char* kUserAuthToken    = "userAuthToken";
inline constexpr const char* kSyncTime         = "syncTime";

inline constexpr const char* kStat             = "stat";
inline constexpr const char* kResult           = "result";
inline constexpr const char* kMessage          = "message";
inline constexpr const char* kCode             = "code";

} // namespace Tuner::wire
