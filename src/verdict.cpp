/************************************************
 PDFgate: implemented in C
 See LICENSE

 Verdict names and messages.
 ************************************************/
#include "verdict.hpp"

// Indexed by gateverdict
static const char *VerdictNames[]=
  {
  "Pass",
  "InvalidStructure",
  "ScriptDetected",
  "FormDetected",
  "ExternalRefDetected",
  "EmbeddedFileDetected"
  };

static const char *VerdictMessages[]=
  {
  "no dangerous content detected",
  "invalid PDF structure",
  "JavaScript detected in PDF",
  "interactive forms detected in PDF",
  "external references detected in PDF",
  "embedded files detected in PDF"
  };

/**************************************
 Gate_VerdictName(): Symbolic name for a verdict.
 Returns: constant string; "Unknown" for out of range values.
 **************************************/
const char *	Gate_VerdictName	(gateverdict Verdict)
{
  if ((Verdict < GATE_PASS) || (Verdict >= GATE_VERDICT_MAX)) { return("Unknown"); }
  return(VerdictNames[Verdict]);
} /* Gate_VerdictName() */

/**************************************
 Gate_VerdictMessage(): Human readable description.
 **************************************/
const char *	Gate_VerdictMessage	(gateverdict Verdict)
{
  if ((Verdict < GATE_PASS) || (Verdict >= GATE_VERDICT_MAX)) { return("unknown verdict"); }
  return(VerdictMessages[Verdict]);
} /* Gate_VerdictMessage() */
