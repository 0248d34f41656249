#ifndef UISTRINGS_H
#define UISTRINGS_H

#include <QString>

enum class UiLanguage {
    Russian,
    English
};

// ─────────────────────────────────────────────────────
// Таблицы строк интерфейса (ru / en).
// Переключение языка = смена таблицы, окна перечитывают тексты по сигналу.
// ─────────────────────────────────────────────────────
class UiStrings
{
public:
    static void setLanguage(UiLanguage language);
    static UiLanguage language();

    // Строка по ключу на текущем языке; неизвестный ключ возвращается как есть
    static QString text(const char* key);
    static QString text(const char* key, UiLanguage language);

    // "RU" / "EN" для кнопки переключения
    static QString languageCode(UiLanguage language);

private:
    static UiLanguage s_language;
};

#endif // UISTRINGS_H
