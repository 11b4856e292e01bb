#ifndef SCHEMAKIT_EXPORT_H
#define SCHEMAKIT_EXPORT_H

#ifdef _WIN32
#ifdef schemakit_EXPORTS
#define SCHEMAKIT_API __declspec(dllexport)
#else
#define SCHEMAKIT_API __declspec(dllimport)
#endif
#else
#define SCHEMAKIT_API
#endif

#endif // SCHEMAKIT_EXPORT_H
