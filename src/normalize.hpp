/************************************************
 PDFgate: implemented in C
 See LICENSE

 Text normalization: stream removal and whitespace folding.
 ************************************************/
#ifndef NORMALIZE_HPP
#define NORMALIZE_HPP

#include <stdlib.h>
#include "gate.hpp"

bool	Gate_isSpace	(byte c);
byte *	Gate_StripStreams	(size_t TextLen, const byte *Text, size_t *OutLen);
byte *	Gate_CollapseSpace	(size_t TextLen, const byte *Text, size_t *OutLen);

#endif
