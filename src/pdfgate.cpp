/************************************************
 PDFgate: implemented in C
 See LICENSE

 Main program.
 Check PDF files (or URLs) for dangerous content.
 ************************************************/
// C headers
#include <stdlib.h>
#include <stdio.h>
#include <unistd.h>
#include <getopt.h> // getopt()

#include "gate.hpp"
#include "files.hpp"
#include "config.hpp"
#include "verdict.hpp"
#include "signatures.hpp"
#include "detect.hpp"
#include "digest.hpp"
#include "fetch.hpp"

/**************************************
 Usage(): Show usage and abort.
 **************************************/
void	Usage	(const char *progname)
{
  printf("Usage: %s [options] file|url [file|url...]\n",progname);
  printf("  Checks each PDF for JavaScript, forms, external references, and embedded files.\n");
  printf("  Exit code: 0 if every input passed, 2 if any was rejected or unreadable.\n");
  printf("\n");
  printf("  -h, -?, --help    :: Show help; this usage\n");
  printf("  --config file.cfg :: Optional configuration file (default: $HOME/.pdfgate.cfg)\n");
  printf("  -v                :: Verbose debugging (probably not what you want)\n");
  printf("  -V, --version     :: Show the code version and exit.\n");
  printf("  -q, --quiet       :: Only show inputs that failed.\n");
  printf("  -W                :: Show the current options as a config file and exit.\n");
  printf("\n");
  printf("  Checking:\n");
  printf("  -A, --digestalg alg  :: Digest (hash) algorithm for identifying inputs (default: sha256)\n");
  printf("               Supports: sha224, sha256, sha384, sha512\n");
  printf("  -m, --maxsize bytes  :: Skip inputs larger than this many bytes (default: 0 = no limit)\n");
  printf("\n");
  printf("  URLs (http, https, ftp, file):\n");
  printf("  -t, --timeout sec    :: Download time limit in seconds (default: 10; 0 = no limit)\n");
  printf("  --cacert file.crt    :: Use file.crt for trusted root certificates.");
  printf(" (default: unset; uses operating system defaults)\n");
  printf("  --cert-insecure      :: Do not validate server's TLS certificate.\n");
  exit(1);
} /* Usage() */

/**************************************
 CheckOne(): Check one buffer and report.
 Returns: true if it passed.
 **************************************/
bool	CheckOne	(gatefield *Args, const gatesigs *Sigs, const char *Name, size_t DataLen, const byte *Data, bool Quiet)
{
  gateverdict Verdict;
  const char *Reason=NULL;
  char *Hex;
  const char *da;

  Verdict = Gate_Check(Sigs,DataLen,Data,&Reason);
  if (Quiet && (Verdict==GATE_PASS)) { return(true); }

  da = GateGetText(Args,"da");
  if (!da || !da[0]) { da="sha256"; }

  printf("[%s]\n",Name);
  Hex = GateDigestHex(da,DataLen,Data);
  if (Hex)
    {
    printf(" %s: %s\n",da,Hex);
    free(Hex);
    }
  else
    {
    printf(" ERROR: Unable to compute %s digest.\n",da);
    }

  if (Verdict==GATE_PASS) { printf(" PASS\n"); }
  else
    {
    printf(" FAIL: %s (%s)",Gate_VerdictName(Verdict),Gate_VerdictMessage(Verdict));
    if (Reason) { printf(" signature=%s",Reason); }
    printf("\n");
    }
  fflush(stdout);
  return(Verdict==GATE_PASS);
} /* CheckOne() */

/**************************************
 main()
 **************************************/
int main (int argc, char *argv[])
{
  gatefield *Args=NULL, *CleanArgs;
  const gatesigs *Sigs;
  int c;
  bool Quiet=false;
  int Checked=0, Failed=0;
  size_t MaxSize;

  // Set default values
  Args = GateSetText(Args,"digestalg","sha256");
  Args = GateSetText(Args,"maxsize","0");
  Args = GateSetText(Args,"timeout","10");
  Args = GateSetText(Args,"cacert","");
  Args = GateSetText(Args,"insecure","0");

  // Set default config file based on user's home.
  Args = GateDefaultCfg(Args);
  Args = GateReadCfg(Args);

  // Read command-line
  int long_option_index;
  struct option long_options[] = {
    {"help",      no_argument, NULL, 'h'},
    {"verbose",   no_argument, NULL, 'v'},
    {"version",   no_argument, NULL, 'V'},
    {"quiet",     no_argument, NULL, 'q'},
    {"config",    required_argument, NULL, 9},
    {"da",        required_argument, NULL, 'A'},
    {"digestalg", required_argument, NULL, 'A'},
    {"maxsize",   required_argument, NULL, 'm'},
    {"timeout",   required_argument, NULL, 't'},
    {"cacert",    required_argument, NULL, 1}, // for specifying root PEMs
    {"cert-insecure", no_argument, NULL, 2}, // for ignoring TLS verification
    {NULL,0,NULL,0}
    };
  while ((c = getopt_long(argc,argv,"A:hm:qt:VvW?",long_options,&long_option_index)) != -1)
    {
    switch(c)
      {
      case 1: // generic longopt with required_argument (and no single-letter mapping)
	Args = GateSetText(Args,long_options[long_option_index].name,optarg);
	break;
      case 2: Args = GateSetText(Args,"insecure","1"); break;
      case 9: // read configuration file
	if (access(optarg, F_OK) != 0)
	  {
	  fprintf(stderr,"ERROR: Configuration file not found: '%s'\n",optarg);
	  exit(1);
	  }
	Args = GateSetText(Args,"config",optarg);
	Args = GateReadCfg(Args);
	break;
      case 'A': Args = GateSetText(Args,"digestalg",optarg); break;
      case 'm': Args = GateSetText(Args,"maxsize",optarg); break;
      case 't': Args = GateSetText(Args,"timeout",optarg); break;
      case 'q': Quiet=true; break;

      case 'V': printf("%s\n",PDFGATE_VERSION); exit(0);
      case 'v': Verbose++; break;

      case 'W': // write the data as a config file
	GateWriteCfg(stdout,Args);
	exit(0);
      case 'h': // help
      case '?': // help
      default:  Usage(argv[0]); GateFree(Args); exit(1);
      }
    } // while reading args

  // Idiot check values
  Args = GateParmCheck(Args);
  if (Verbose > 3) { DEBUGWALK("Post-CLI Parameters",Args); } // DEBUGGING

  // Process all args (files required)
  if (optind >= argc)
    {
    fprintf(stderr,"ERROR: No input files.\n");
    exit(1);
    }

  // Compile once; shared read-only by every check
  Sigs = Gate_SigsDefault();
  MaxSize = GateGetIindex(Args,"@maxsize",0);

  // Don't mess up command-line parameters
  CleanArgs = Args;
  Args=NULL;

  for( ; optind < argc; optind++)
    {
    const char *Name = argv[optind];

    // Start off with a clean set of parameters
    if (Args) { GateFree(Args); Args=NULL; }
    Args = GateClone(CleanArgs);
    Checked++;

    if (GateIsURL(Name))
      {
      Args = GateFetchURL(Args,Name);
      if (!GateSearch(Args,"@download"))
	{
	printf("[%s]\n ERROR: %s. Skipping.\n",Name,GateGetText(Args,"@error"));
	Failed++;
	continue;
	}
      if (!CheckOne(Args,Sigs,Name,GateGetSize(Args,"@download"),GateGetBin(Args,"@download"),Quiet)) { Failed++; }
      }
    else
      {
      // Memory map the file; the check never copies the whole file.
      mmapfile *Mmap=NULL;
      Mmap = MmapFile(Name);
      if (!Mmap)
	{
	printf("[%s]\n ERROR: Unknown file '%s'. Skipping.\n",Name,Name);
	Failed++;
	continue;
	}
      if (MaxSize && (Mmap->memsize > MaxSize))
	{
	printf("[%s]\n ERROR: File exceeds maxsize (%lu > %lu bytes). Skipping.\n",
		Name,(unsigned long)Mmap->memsize,(unsigned long)MaxSize);
	MmapFree(Mmap);
	Failed++;
	continue;
	}
      if (!CheckOne(Args,Sigs,Name,Mmap->memsize,Mmap->mem,Quiet)) { Failed++; }
      MmapFree(Mmap);
      }

    if (Verbose > 1) { DEBUGWALK("Post-File Parameters",Args); } // DEBUGGING
    } // foreach command-line file

  if (Verbose) { fprintf(stderr,"Checked %d input(s); %d rejected or skipped.\n",Checked,Failed); }

  // Clean up
  if (Args) { GateFree(Args); Args=NULL; }
  GateFree(CleanArgs); // free memory for completeness
  return(Failed ? 2 : 0);
} /* main() */
