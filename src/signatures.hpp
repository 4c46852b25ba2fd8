/************************************************
 PDFgate: implemented in C
 See LICENSE

 Signature patterns: the compiled dangerous-feature markers.

 A signature set is built once and never changed.
 Every detector takes it as a read-only parameter, so
 any number of checks can share one set without locking.
 ************************************************/
#ifndef SIGNATURES_HPP
#define SIGNATURES_HPP

#include <stdlib.h>
#include <re2/re2.h>

#include "gate.hpp"

/*****
 Pattern source text.
 Each list is NULL-terminated and evaluated in order.
 *****/
typedef struct
  {
  const char **Script;   // matched against stream-stripped, whitespace-collapsed text
  const char **Forms;    // matched against raw text
  const char **External; // matched against whitespace-collapsed text
  const char **Embedded; // matched against raw text
  const char *HexRun;     // '#' hex escapes; located individually
  const char *HexAngle;   // <hex> strings
  const char *ScriptWord; // scripting vocabulary near/with hex data
  } gatesigsrc;

typedef struct
  {
  size_t Count;
  RE2 **Rx;
  } gatesiglist;

typedef struct
  {
  gatesiglist Script;
  gatesiglist Forms;
  gatesiglist External;
  gatesiglist Embedded;
  RE2 *HexRun;
  RE2 *HexAngle;
  RE2 *ScriptWord;
  } gatesigs;

extern const gatesigsrc GateDefaultPatterns;

gatesigs *	Gate_SigsCompile	(const gatesigsrc *Src);
void	Gate_SigsFree	(gatesigs *Sigs);
const gatesigs *	Gate_SigsDefault	();

int	Gate_SigsMatch	(const gatesiglist *List, size_t TextLen, const byte *Text);
bool	Gate_SigsFind	(const RE2 *Rx, size_t TextLen, const byte *Text, size_t StartPos, size_t *MatchStart, size_t *MatchEnd);

#endif
