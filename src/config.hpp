/************************************************
 PDFgate: implemented in C
 See LICENSE

 Configuration file handling.
 ************************************************/
#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <stdio.h>
#include "gate.hpp"

gatefield *	GateDefaultCfg	(gatefield *Args);
gatefield *	GateReadCfg	(gatefield *Args);
void	GateWriteCfg	(FILE *fp, gatefield *Args);

#endif
