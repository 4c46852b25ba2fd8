/************************************************
 PDFgate: implemented in C
 See LICENSE

 Detectors and the top-level check.

 Every function takes the document as (length, bytes);
 the bytes are never modified.
 Reason is optional (may be NULL). When a detector fires,
 it is set to the pattern that matched. It is only for
 diagnostics and never changes the verdict.
 ************************************************/
#ifndef DETECT_HPP
#define DETECT_HPP

#include <stdlib.h>
#include "gate.hpp"
#include "verdict.hpp"
#include "signatures.hpp"

#define GATE_HEADER_WINDOW	1024 // search for "%PDF-" in this many leading bytes
#define GATE_HEX_CONTEXT	80 // look this far before a hex run for script words

gateverdict	Gate_ValidateStructure	(size_t DataLen, const byte *Data);
gateverdict	Gate_DetectScript	(const gatesigs *Sigs, size_t TextLen, const byte *Text, const char **Reason);
gateverdict	Gate_DetectForms	(const gatesigs *Sigs, size_t TextLen, const byte *Text, const char **Reason);
gateverdict	Gate_DetectExternalRefs	(const gatesigs *Sigs, size_t TextLen, const byte *Text, const char **Reason);
gateverdict	Gate_DetectEmbeddedFiles	(const gatesigs *Sigs, size_t TextLen, const byte *Text, const char **Reason);

gateverdict	Gate_Check	(const gatesigs *Sigs, size_t DataLen, const byte *Data, const char **Reason);
gateverdict	Gate_CheckDefault	(size_t DataLen, const byte *Data);

#endif
