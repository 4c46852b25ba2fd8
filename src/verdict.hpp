/************************************************
 PDFgate: implemented in C
 See LICENSE

 Verdicts: the closed set of check results.
 Compare verdicts by value, never by their text.
 ************************************************/
#ifndef VERDICT_HPP
#define VERDICT_HPP

enum gateverdict{
  GATE_PASS=0,
  GATE_INVALID_STRUCTURE,
  GATE_SCRIPT_DETECTED,
  GATE_FORM_DETECTED,
  GATE_EXTERNAL_REF_DETECTED,
  GATE_EMBEDDED_FILE_DETECTED,
  GATE_VERDICT_MAX // not a verdict; array size
};

const char *	Gate_VerdictName	(gateverdict Verdict);
const char *	Gate_VerdictMessage	(gateverdict Verdict);

#endif
