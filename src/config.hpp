#pragma once

/*here you can change the compile-time defaults; runtime options live in the rc file*/

#ifndef KANTEN_RC_NAME
#define KANTEN_RC_NAME ".kantenrc"
#endif

#define KANTEN_RC_ENV "KANTENRC"

#ifndef KANTEN_DEFAULT_TABSTOP
#define KANTEN_DEFAULT_TABSTOP 4
#endif

#define KANTEN_MAX_TABSTOP 16

// rows reserved under the list for the status bar
#define KANTEN_STATUS_ROWS 1
