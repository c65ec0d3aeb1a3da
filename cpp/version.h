#ifndef version_h
#define version_h

#define __version__ "1.0.0"

#endif
