#pragma once

/*compile-time defaults; each can be overridden with -D at build time*/

#ifndef LP_DEFAULT_CHUNK_SIZE
#define LP_DEFAULT_CHUNK_SIZE 4096
#endif

/*lines held by a reader when no window size is given*/
#ifndef LP_DEFAULT_WINDOW_SIZE
#define LP_DEFAULT_WINDOW_SIZE 100
#endif

#ifndef LP_DEFAULT_POLL_MS
#define LP_DEFAULT_POLL_MS 500
#endif

#ifndef LP_RC_FILE_NAME
#define LP_RC_FILE_NAME ".logpagerrc"
#endif
