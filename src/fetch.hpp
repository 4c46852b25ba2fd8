/************************************************
 PDFgate: implemented in C
 See LICENSE

 Retrieving documents from URLs.
 ************************************************/
#ifndef FETCH_HPP
#define FETCH_HPP

// C headers
#include <stdlib.h>
#include <stdio.h>
#include <unistd.h>

#include "gate.hpp"

bool	GateIsURL	(const char *Str);
gatefield *	GateFetchURL	(gatefield *Args, const char *URL);

#endif
