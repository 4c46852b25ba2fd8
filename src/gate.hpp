/************************************************
 PDFgate: implemented in C
 See LICENSE

 Common types, debugging macros, and the parameters
 data structure.

 Parameters (defaults, config file, command-line, and
 per-file results) are stored as a linked list of
 field=value records. Field names beginning with "@" are
 internal and never come from the user.
 ************************************************/
#ifndef PDFGATE_HPP
#define PDFGATE_HPP

#include <stdlib.h>
#include <stdio.h>
#include <unistd.h>
#include <stdint.h>

// Revise the version if there is any significant change
#define PDFGATE_VERSION "0.1.3"

extern int Verbose;

// Common data types
typedef unsigned char byte;
struct gatefield
  {
  // 'c' text, 'b' binary, 'I' size_t array
  char Type;

  char *Field;
  byte *Value;
  size_t FieldLen; // length of field. e.g., "maxsize" would be 7
  size_t ValueLen; // length of value, not counting null padding
  struct gatefield *Next;
  };
typedef struct gatefield gatefield;

// Macros and code for debugging
#define WHERESTR  "DEBUG[%s:%d]"
#define WHEREARG  __FILE__, __LINE__
#define DEBUGPRINT2(...)       fprintf(stderr, __VA_ARGS__)
#define DEBUGPRINT(_fmt, ...)  DEBUGPRINT2(WHERESTR ": " _fmt "\n", WHEREARG, __VA_ARGS__)
#define DEBUGWHERE()  DEBUGPRINT2(WHERESTR "\n", WHEREARG)
#define DEBUGWALK(x,y) { DEBUGPRINT2(WHERESTR ": WALK: %s\n", WHEREARG, x); GateWalk(y,false); }
#define DEBUGSHOW(x,y) { DEBUGPRINT2(WHERESTR ": SHOW: %s\n", WHEREARG, x); GateWalk(y,true); }
void	DEBUGhexdump	(size_t DataLen, const byte *Data);

// Common macros
#define Min(x,y)  ( ((x) < (y)) ? (x) : (y) )

// Parameter structure functions
void	GateFree	(gatefield *vf);
void	GateWalk	(gatefield *vf, bool ShowOne);
gatefield *	GateSearch	(gatefield *vf, const char *Field);
gatefield *	GateDel		(gatefield *vfhead, const char *Field);
gatefield *	GateRename	(gatefield *vfhead, const char *From, const char *To);
gatefield *	GateClone	(gatefield *src);
size_t	GateGetSize	(gatefield *vfhead, const char *Field); // value length in bytes
gatefield *	GateParmCheck	(gatefield *Args);

// Binary data
byte *	GateGetBin	(gatefield *vfhead, const char *Field);
gatefield *	GateSetBin	(gatefield *vfhead, const char *Field, size_t ValueLen, const byte *Value);
gatefield *	GateAddBin	(gatefield *vfhead, const char *Field, size_t ValueLen, const byte *Value);

// Text data
char *	GateGetText	(gatefield *vfhead, const char *Field);
gatefield *	GateSetText	(gatefield *vfhead, const char *Field, const char *Value);
gatefield *	GateAddText	(gatefield *vfhead, const char *Field, const char *Value);

// size_t data (as an array)
size_t		GateGetIindex	(gatefield *vfhead, const char *Field, int Index);
gatefield *	GateSetIindex	(gatefield *vfhead, const char *Field, int Index, size_t Value);

#endif
