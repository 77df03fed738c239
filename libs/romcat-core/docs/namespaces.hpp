/**
@file
@brief Namespace documentation.
*/

/**
@namespace romcat
@brief The root namespace of the romcat core library.
*/

/**
@namespace romcat::catalog
@brief The game catalog: entity types, the SQLite store, curated definitions and release name parsing.
*/

/**
@namespace romcat::db
@brief Reference game databases and the in-memory hash index built from them.
*/

/**
@namespace romcat::media
@brief Dump file handling: header detection and streaming hashing with padding.
*/

/**
@namespace romcat::repair
@brief Detection and application of padding repairs for byte-imperfect dumps.
*/

/**
@namespace romcat::import
@brief Batch operations over the catalog: reference imports, overrides, reconciliation and file scans.
*/

/**
@namespace util
@brief General-purpose utilities.
*/
