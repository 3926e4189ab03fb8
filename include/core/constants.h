/**
 * @file constants.h
 * @brief Core constants for the setupforge library
 */

#ifndef SETUPFORGE_CONSTANTS_H
#define SETUPFORGE_CONSTANTS_H

#ifndef PROJECT_VERSION
#define PROJECT_VERSION "0.0.0"
#endif
#define SETUPFORGE_VERSION PROJECT_VERSION

#ifndef SETUPFORGE_DEFAULT_CATALOG_DIR
#define SETUPFORGE_DEFAULT_CATALOG_DIR "/usr/local/share/setupforge/catalog"
#endif

/* Environment variable overriding the catalog directory */
#define SETUPFORGE_CATALOG_ENV "SETUPFORGE_CATALOG"

/* Workspace layout */
#define SETUP_DIR ".setup"
#define TOOLS_FILE "tools.toml"
#define INSTALL_SCRIPT_FILE "install.sh"
#define VARS_FILE "vars.toml"
#define SECRETS_FILE "secrets.toml"
#define HASH_STATE_FILE "setupforge.hash"
#define GITIGNORE_FILE ".gitignore"

/* Catalog layout */
#define META_FILE "meta.toml"
#define COMPONENT_SCRIPT_FILE "install.sh"

#ifdef _MSC_VER
#pragma warning(disable : 4996)
#endif

#endif
