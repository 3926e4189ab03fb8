#include "test_framework.h"
#include <stdio.h>
#include <string>
#include <vector>
#include <algorithm>

int ComponentId_AcceptsCommonNames();
int ComponentId_RejectsEmptyAndDots();
int ComponentId_RejectsSeparatorsAndSpaces();
int ComponentId_RejectsNonAscii();
int ComponentId_ParseReportsInvalidId();
int ComponentId_OrdersLexicographically();
int DependencyGraph_DependenciesComeFirst();
int DependencyGraph_ReadyComponentsInAscendingOrder();
int DependencyGraph_IndependentOfInsertionOrder();
int DependencyGraph_EachComponentOnce();
int DependencyGraph_PrecedenceHolds();
int DependencyGraph_EmptySelection();
int DependencyGraph_ReportsCyclePath();
int DependencyGraph_CycleBelowAcyclicRoot();
int DependencyGraph_UnknownSelection();
int DependencyGraph_InvalidSelectionId();
int DependencyGraph_DanglingDependency();
int DependencyGraph_SelfDependency();
int DependencyGraph_EmptyId();
int DependencyGraph_DuplicateEnvName();
int DependencyGraph_InvalidEnvName();
int DependencyGraph_SecrecyConflictAcrossComponents();
int DependencyGraph_SharedEnvWithSameSecrecy();
int DependencyGraph_DuplicateComponentId();
int DependencyGraph_TraversalMarksClosureDone();
int InstallScript_StartsWithPreamble();
int InstallScript_BlocksFollowResolvedOrder();
int InstallScript_StepsVerbatimInDeclaredOrder();
int InstallScript_Deterministic();
int InstallScript_ComponentWithoutSteps();
int InstallScript_MissingCatalogEntryStillTotal();
int InstallScript_EmptyOrderIsPreambleOnly();
int EnvMerge_PreservesExistingSecret();
int EnvMerge_InsertsDefaultIntoEmptyDocument();
int EnvMerge_AbsentDocumentsBehaveLikeEmpty();
int EnvMerge_SecretPlaceholderIsEmptyString();
int EnvMerge_KeepsUserValuesAndComments();
int EnvMerge_AppendsAfterExistingText();
int EnvMerge_RejectsMalformedDocument();
int EnvMerge_RejectsMalformedSecretDocument();
int EnvMerge_RejectsNestedTables();
int EnvMerge_FixedPoint();
int EnvMerge_FirstDeclarationWins();
int EnvMerge_ReportsMisplacedKey();
int EnvMerge_EscapesDefaultValues();
int EnvMerge_NothingToAddKeepsDocumentsAsIs();
int EnvMerge_KeepsWhitespaceOnlyDocument();
int CatalogLoader_FullMetadata();
int CatalogLoader_DefaultsFromDirectoryName();
int CatalogLoader_EnvSpecsSortedWithinSection();
int CatalogLoader_KeyInVarsAndSecrets();
int CatalogLoader_ParseErrorNamesComponent();
int CatalogLoader_RejectsBadNames();
int CatalogLoader_LoadsDirectory();
int CatalogLoader_MissingDirectory();
int CatalogLoader_DuplicateNameAcrossDirectories();
int CatalogLoader_UnreadableScriptIsAnError();
int ToolsConfig_ParsesList();
int ToolsConfig_DropsDuplicates();
int ToolsConfig_DefaultTemplateParses();
int ToolsConfig_RejectsMalformed();
int ToolsConfig_RejectsMissingOrEmpty();
int ToolsConfig_RejectsNonStringEntry();
int ToolsConfig_RejectsInvalidId();
int ArtifactState_KnownHashes();
int ArtifactState_LoadMissing();
int ArtifactState_SaveAndReload();
int ArtifactState_SerializeIsStable();
int ArtifactState_DetectsModification();
int ArtifactState_RejectsGarbage();
int FileUtils_AtomicWriteReplacesContent();
int FileUtils_ReadMissingFile();
int FileUtils_ReadEmptyFileIsPresent();
int FileUtils_ReadDirectoryIsError();
int FileUtils_WriteIntoMissingDirectoryFails();
int Cli_ParsesGlobalAndCommandFlags();
int Cli_ParsesDetailAndPositional();
int Cli_RejectsMissingOptionValue();
int Cli_RejectsUnknownCommandOption();
int Cli_RejectsOverlongWorkingDir();
int Cli_CatalogFlagWins();
int Cli_InitCreatesSetupDir();
int Cli_GenRequiresInit();
int Cli_GenWritesArtifacts();
int Cli_GenKeepsUserValues();
int Cli_GenRefusesHandEditedScript();
int Cli_GenWritesNothingOnCycle();
int Cli_GenRefusesUnreadableSecrets();
int Cli_GenRefusesUnreadableTools();
int Cli_ListUnknownDetail();

struct test_entry { const char* full; int (*fn)(); };
static test_entry tests[] = {
  {"ComponentId.AcceptsCommonNames", ComponentId_AcceptsCommonNames},
  {"ComponentId.RejectsEmptyAndDots", ComponentId_RejectsEmptyAndDots},
  {"ComponentId.RejectsSeparatorsAndSpaces", ComponentId_RejectsSeparatorsAndSpaces},
  {"ComponentId.RejectsNonAscii", ComponentId_RejectsNonAscii},
  {"ComponentId.ParseReportsInvalidId", ComponentId_ParseReportsInvalidId},
  {"ComponentId.OrdersLexicographically", ComponentId_OrdersLexicographically},
  {"DependencyGraph.DependenciesComeFirst", DependencyGraph_DependenciesComeFirst},
  {"DependencyGraph.ReadyComponentsInAscendingOrder", DependencyGraph_ReadyComponentsInAscendingOrder},
  {"DependencyGraph.IndependentOfInsertionOrder", DependencyGraph_IndependentOfInsertionOrder},
  {"DependencyGraph.EachComponentOnce", DependencyGraph_EachComponentOnce},
  {"DependencyGraph.PrecedenceHolds", DependencyGraph_PrecedenceHolds},
  {"DependencyGraph.EmptySelection", DependencyGraph_EmptySelection},
  {"DependencyGraph.ReportsCyclePath", DependencyGraph_ReportsCyclePath},
  {"DependencyGraph.CycleBelowAcyclicRoot", DependencyGraph_CycleBelowAcyclicRoot},
  {"DependencyGraph.UnknownSelection", DependencyGraph_UnknownSelection},
  {"DependencyGraph.InvalidSelectionId", DependencyGraph_InvalidSelectionId},
  {"DependencyGraph.DanglingDependency", DependencyGraph_DanglingDependency},
  {"DependencyGraph.SelfDependency", DependencyGraph_SelfDependency},
  {"DependencyGraph.EmptyId", DependencyGraph_EmptyId},
  {"DependencyGraph.DuplicateEnvName", DependencyGraph_DuplicateEnvName},
  {"DependencyGraph.InvalidEnvName", DependencyGraph_InvalidEnvName},
  {"DependencyGraph.SecrecyConflictAcrossComponents", DependencyGraph_SecrecyConflictAcrossComponents},
  {"DependencyGraph.SharedEnvWithSameSecrecy", DependencyGraph_SharedEnvWithSameSecrecy},
  {"DependencyGraph.DuplicateComponentId", DependencyGraph_DuplicateComponentId},
  {"DependencyGraph.TraversalMarksClosureDone", DependencyGraph_TraversalMarksClosureDone},
  {"InstallScript.StartsWithPreamble", InstallScript_StartsWithPreamble},
  {"InstallScript.BlocksFollowResolvedOrder", InstallScript_BlocksFollowResolvedOrder},
  {"InstallScript.StepsVerbatimInDeclaredOrder", InstallScript_StepsVerbatimInDeclaredOrder},
  {"InstallScript.Deterministic", InstallScript_Deterministic},
  {"InstallScript.ComponentWithoutSteps", InstallScript_ComponentWithoutSteps},
  {"InstallScript.MissingCatalogEntryStillTotal", InstallScript_MissingCatalogEntryStillTotal},
  {"InstallScript.EmptyOrderIsPreambleOnly", InstallScript_EmptyOrderIsPreambleOnly},
  {"EnvMerge.PreservesExistingSecret", EnvMerge_PreservesExistingSecret},
  {"EnvMerge.InsertsDefaultIntoEmptyDocument", EnvMerge_InsertsDefaultIntoEmptyDocument},
  {"EnvMerge.AbsentDocumentsBehaveLikeEmpty", EnvMerge_AbsentDocumentsBehaveLikeEmpty},
  {"EnvMerge.SecretPlaceholderIsEmptyString", EnvMerge_SecretPlaceholderIsEmptyString},
  {"EnvMerge.KeepsUserValuesAndComments", EnvMerge_KeepsUserValuesAndComments},
  {"EnvMerge.AppendsAfterExistingText", EnvMerge_AppendsAfterExistingText},
  {"EnvMerge.RejectsMalformedDocument", EnvMerge_RejectsMalformedDocument},
  {"EnvMerge.RejectsMalformedSecretDocument", EnvMerge_RejectsMalformedSecretDocument},
  {"EnvMerge.RejectsNestedTables", EnvMerge_RejectsNestedTables},
  {"EnvMerge.FixedPoint", EnvMerge_FixedPoint},
  {"EnvMerge.FirstDeclarationWins", EnvMerge_FirstDeclarationWins},
  {"EnvMerge.ReportsMisplacedKey", EnvMerge_ReportsMisplacedKey},
  {"EnvMerge.EscapesDefaultValues", EnvMerge_EscapesDefaultValues},
  {"EnvMerge.NothingToAddKeepsDocumentsAsIs", EnvMerge_NothingToAddKeepsDocumentsAsIs},
  {"EnvMerge.KeepsWhitespaceOnlyDocument", EnvMerge_KeepsWhitespaceOnlyDocument},
  {"CatalogLoader.FullMetadata", CatalogLoader_FullMetadata},
  {"CatalogLoader.DefaultsFromDirectoryName", CatalogLoader_DefaultsFromDirectoryName},
  {"CatalogLoader.EnvSpecsSortedWithinSection", CatalogLoader_EnvSpecsSortedWithinSection},
  {"CatalogLoader.KeyInVarsAndSecrets", CatalogLoader_KeyInVarsAndSecrets},
  {"CatalogLoader.ParseErrorNamesComponent", CatalogLoader_ParseErrorNamesComponent},
  {"CatalogLoader.RejectsBadNames", CatalogLoader_RejectsBadNames},
  {"CatalogLoader.LoadsDirectory", CatalogLoader_LoadsDirectory},
  {"CatalogLoader.MissingDirectory", CatalogLoader_MissingDirectory},
  {"CatalogLoader.DuplicateNameAcrossDirectories", CatalogLoader_DuplicateNameAcrossDirectories},
  {"CatalogLoader.UnreadableScriptIsAnError", CatalogLoader_UnreadableScriptIsAnError},
  {"ToolsConfig.ParsesList", ToolsConfig_ParsesList},
  {"ToolsConfig.DropsDuplicates", ToolsConfig_DropsDuplicates},
  {"ToolsConfig.DefaultTemplateParses", ToolsConfig_DefaultTemplateParses},
  {"ToolsConfig.RejectsMalformed", ToolsConfig_RejectsMalformed},
  {"ToolsConfig.RejectsMissingOrEmpty", ToolsConfig_RejectsMissingOrEmpty},
  {"ToolsConfig.RejectsNonStringEntry", ToolsConfig_RejectsNonStringEntry},
  {"ToolsConfig.RejectsInvalidId", ToolsConfig_RejectsInvalidId},
  {"ArtifactState.KnownHashes", ArtifactState_KnownHashes},
  {"ArtifactState.LoadMissing", ArtifactState_LoadMissing},
  {"ArtifactState.SaveAndReload", ArtifactState_SaveAndReload},
  {"ArtifactState.SerializeIsStable", ArtifactState_SerializeIsStable},
  {"ArtifactState.DetectsModification", ArtifactState_DetectsModification},
  {"ArtifactState.RejectsGarbage", ArtifactState_RejectsGarbage},
  {"FileUtils.AtomicWriteReplacesContent", FileUtils_AtomicWriteReplacesContent},
  {"FileUtils.ReadMissingFile", FileUtils_ReadMissingFile},
  {"FileUtils.ReadEmptyFileIsPresent", FileUtils_ReadEmptyFileIsPresent},
  {"FileUtils.ReadDirectoryIsError", FileUtils_ReadDirectoryIsError},
  {"FileUtils.WriteIntoMissingDirectoryFails", FileUtils_WriteIntoMissingDirectoryFails},
  {"Cli.ParsesGlobalAndCommandFlags", Cli_ParsesGlobalAndCommandFlags},
  {"Cli.ParsesDetailAndPositional", Cli_ParsesDetailAndPositional},
  {"Cli.RejectsMissingOptionValue", Cli_RejectsMissingOptionValue},
  {"Cli.RejectsUnknownCommandOption", Cli_RejectsUnknownCommandOption},
  {"Cli.RejectsOverlongWorkingDir", Cli_RejectsOverlongWorkingDir},
  {"Cli.CatalogFlagWins", Cli_CatalogFlagWins},
  {"Cli.InitCreatesSetupDir", Cli_InitCreatesSetupDir},
  {"Cli.GenRequiresInit", Cli_GenRequiresInit},
  {"Cli.GenWritesArtifacts", Cli_GenWritesArtifacts},
  {"Cli.GenKeepsUserValues", Cli_GenKeepsUserValues},
  {"Cli.GenRefusesHandEditedScript", Cli_GenRefusesHandEditedScript},
  {"Cli.GenWritesNothingOnCycle", Cli_GenWritesNothingOnCycle},
  {"Cli.GenRefusesUnreadableSecrets", Cli_GenRefusesUnreadableSecrets},
  {"Cli.GenRefusesUnreadableTools", Cli_GenRefusesUnreadableTools},
  {"Cli.ListUnknownDetail", Cli_ListUnknownDetail},
};

int main(int argc, char** argv) {
  std::string category;
  std::vector<std::string> test_filters;
  // Positional args: first is category (optional), rest are test names
  for (int i = 1; i < argc; ++i) {
    if (i == 1) category = argv[i]; else test_filters.emplace_back(argv[i]);
  }
  int failures = 0;
  size_t run_count = 0;
  for (auto& tc : tests) {
    std::string full(tc.full);
    std::string cat, name; auto pos = full.find('.');
    if (pos == std::string::npos) { name = full; } else { cat = full.substr(0,pos); name = full.substr(pos+1); }
    if (!category.empty() && cat != category) continue;
    if (!test_filters.empty() && std::find(test_filters.begin(), test_filters.end(), name) == test_filters.end()) continue;
    ++run_count;
    printf(COLOR_CYAN "[RUN] %s" COLOR_RESET "\n", tc.full);
    int res = tc.fn();
    if (res) { printf(COLOR_RED "[FAIL] %s" COLOR_RESET "\n", tc.full); ++failures; } else { printf(COLOR_GREEN "[PASS] %s" COLOR_RESET "\n", tc.full); }
  }
  printf("Ran %zu tests: %d failures\n", run_count, failures);
  if (run_count == 0) {
    fprintf(stderr, "No tests matched '%s'\n", category.c_str());
    return 1;
  }
  return failures;
}
