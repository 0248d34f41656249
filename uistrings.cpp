#include "uistrings.h"

#include <QHash>

UiLanguage UiStrings::s_language = UiLanguage::Russian;

namespace {

struct Entry {
    const char* key;
    const char* ru;
    const char* en;
};

const Entry kEntries[] = {
    // ——— Общие ———
    { "app_title",          "NanoSizer — измерение наночастиц", "NanoSizer — Nanoparticle Measurement" },
    { "warn",               "Предупреждение",        "Warning" },
    { "error",              "Ошибка",                "Error" },
    { "confirm",            "Подтверждение",         "Confirm" },
    { "info",               "Информация",            "Information" },
    { "status_ready",       "Откройте изображение (Ctrl+O)", "Open an image (Ctrl+O)" },
    { "no_image",           "Сначала откройте изображение", "Please open an image first" },
    { "no_data",            "Нет измерений",         "No measurements" },

    // ——— Режимы ———
    { "mode_idle",          "Просмотр",              "View" },
    { "mode_calibrating",   "Калибровка масштаба",   "Scale calibration" },
    { "mode_measuring",     "Измерение",             "Measuring" },
    { "mode_group",         "Выделение группы",      "Group selection" },
    { "mode_pick_color",    "Выбор цвета",           "Color picking" },

    // ——— Калибровка ———
    { "scale_click1",       "Кликните начало масштабной линейки", "Click the start of the scale bar" },
    { "scale_click2",       "Кликните конец масштабной линейки", "Click the end of the scale bar" },
    { "scale_dialog_title", "Масштаб",               "Scale" },
    { "scale_pixels",       "Длина отрезка, px:",    "Segment length, px:" },
    { "scale_length",       "Физическая длина:",     "Physical length:" },
    { "scale_unit",         "Единица:",              "Unit:" },
    { "scale_set",          "Масштаб: %1 %2/px",     "Scale: %1 %2/px" },
    { "scale_none",         "Масштаб не задан",      "Scale not set" },

    // ——— Измерение ———
    { "meas_click1",        "Кликните первую точку диаметра", "Click the first point of the diameter" },
    { "meas_click2",        "Кликните вторую точку (Esc — отмена)", "Click the second point (Esc to cancel)" },
    { "meas_recorded",      "Измерение #%1: %2 %3",  "Measurement #%1: %2 %3" },
    { "meas_cancelled",     "Клик отменён",          "Click cancelled" },
    { "meas_too_short",     "Точки слишком близко",  "Points are too close" },
    { "meas_milestone",     "Выполнено %1 измерений", "%1 measurements recorded" },
    { "undo_meas",          "Отменено измерение #%1", "Undid measurement #%1" },
    { "clear_confirm",      "Удалить все измерения и группы?", "Delete all measurements and groups?" },
    { "delete_confirm",     "Удалить выбранные измерения?", "Delete the selected measurements?" },

    // ——— Группы ———
    { "group_hint",         "Растяните рамку вокруг частиц группы", "Drag a rectangle around the group's particles" },
    { "group_name_prompt",  "Название группы:",      "Group name:" },
    { "group_created",      "Группа «%1»: %2 измерений", "Group \"%1\": %2 measurements" },
    { "group_empty",        "В рамке нет измерений", "No measurements inside the rectangle" },
    { "group_deleted",      "Группа «%1» удалена",   "Group \"%1\" deleted" },
    { "group_delete_prompt", "Какую группу удалить?", "Which group to delete?" },
    { "group_all",          "Все измерения",         "All measurements" },
    { "group_none",         "—",                     "—" },

    // ——— Таблица / статистика ———
    { "cursor_pos",         "x = %1, y = %2 px",     "x = %1, y = %2 px" },
    { "zoom_fmt",           "Масштаб вида: %1 %",    "Zoom: %1 %" },

    { "col_id",             "№",                     "#" },
    { "col_value",          "Диаметр, %1",           "Diameter, %1" },
    { "col_pixels",         "px",                    "px" },
    { "col_group",          "Группа",                "Group" },
    { "stats_fmt",          "N = %1   среднее = %2 ± %3 %4   мин = %5   макс = %6",
                            "N = %1   mean = %2 ± %3 %4   min = %5   max = %6" },
    { "stats_na",           "N/A",                   "N/A" },

    // ——— Файлы ———
    { "open_image_title",   "Открыть изображение",   "Open image" },
    { "img_files",          "Изображения",           "Images" },
    { "all_files",          "Все файлы",             "All files" },
    { "open_fail",          "Не удалось открыть файл:\n%1", "Cannot open file:\n%1" },
    { "export_title",       "Экспорт CSV",           "Export CSV" },
    { "csv_files",          "CSV файлы",             "CSV files" },
    { "exported",           "Экспортировано: %1",    "Exported: %1" },
    { "export_fail",        "Ошибка экспорта: %1",   "Export failed: %1" },

    // ——— Распределение ———
    { "dist_title",         "Распределение размеров", "Size distribution" },
    { "dist_group",         "Данные:",               "Data:" },
    { "dist_bins",          "Столбцов:",             "Bins:" },
    { "dist_auto",          "авто",                  "auto" },
    { "dist_method",        "Метод:",                "Method:" },
    { "dist_ls",            "Наименьшие квадраты",   "Least squares" },
    { "dist_ml",            "Максимальное правдоподобие", "Maximum likelihood" },
    { "dist_refresh",       "Обновить",              "Refresh" },
    { "dist_export",        "Экспорт CSV",           "Export CSV" },
    { "hist_title_fmt",     "μ = %1 %3, σ = %2 %3 (N = %4)", "μ = %1 %3, σ = %2 %3 (N = %4)" },
    { "hist_xlabel",        "Диаметр, %1",           "Diameter, %1" },
    { "hist_ylabel",        "Количество",            "Count" },
    { "hist_legend_hist",   "Гистограмма",           "Histogram" },
    { "hist_legend_fit",    "Гауссова аппроксимация", "Gaussian fit" },
    { "hist_no_fit",        "Аппроксимация не сошлась", "Fit did not converge" },

    // ——— Цветовой анализ ———
    { "color_analysis",     "Цветовой анализ",       "Color analysis" },
    { "pick_color_hint",    "Кликните по частице, чтобы выбрать цвет", "Click a particle to pick its color" },
    { "ca_picked_color",    "Выбранные цвета:",      "Picked colors:" },
    { "ca_add_color",       "Добавить цвет",         "Add color" },
    { "ca_undo_color",      "Убрать цвет",           "Remove color" },
    { "ca_auto_tol",        "Авто допуск",           "Auto tolerance" },
    { "ca_tolerance",       "Допуск HSV",            "HSV tolerance" },
    { "ca_h_tol",           "H:",                    "H:" },
    { "ca_s_tol",           "S:",                    "S:" },
    { "ca_v_tol",           "V:",                    "V:" },
    { "ca_min_area",        "Мин. площадь, px:",     "Min area, px:" },
    { "ca_detect",          "Найти частицы",         "Detect particles" },
    { "ca_particle_count",  "Частиц: %1",            "Particles: %1" },
    { "ca_total_area",      "Суммарная площадь: %1 px² (%2 %3²)", "Total area: %1 px² (%2 %3²)" },
    { "ca_coverage",        "Покрытие: %1 %",        "Coverage: %1 %" },
    { "ca_col_area",        "Площадь, %1²",          "Area, %1²" },
    { "ca_hist_xlabel",     "Площадь, %1²",          "Area, %1²" },
    { "ca_export_csv",      "Экспорт площадей",      "Export areas" },
    { "ca_no_color",        "Сначала выберите цвет", "Pick a color first" },
    { "ca_split",           "Разрезать частицы",     "Split particles" },
    { "ca_brush",           "Кисть, px:",            "Brush, px:" },
    { "ca_undo_split",      "Отменить разрез",       "Undo cut" },
    { "ca_clear_splits",    "Убрать разрезы",        "Clear cuts" },
    { "ca_split_hint",      "Проведите линию через перемычку между частицами",
                            "Drag a line across the neck between particles" },

    // ——— Меню ———
    { "menu_file",          "Файл",                  "File" },
    { "menu_open",          "Открыть...",            "Open..." },
    { "menu_export",        "Экспорт CSV...",        "Export CSV..." },
    { "menu_exit",          "Выход",                 "Exit" },
    { "menu_tools",         "Инструменты",           "Tools" },
    { "menu_calibrate",     "Калибровка масштаба",   "Calibrate scale" },
    { "menu_measure",       "Измерение",             "Measure" },
    { "menu_group",         "Выделить группу",       "Select group" },
    { "menu_delete_group",  "Удалить группу...",     "Delete group..." },
    { "menu_undo",          "Отменить",              "Undo" },
    { "menu_delete",        "Удалить выбранные",     "Delete selected" },
    { "menu_clear",         "Очистить всё",          "Clear all" },
    { "menu_distribution",  "Распределение...",      "Distribution..." },
    { "menu_view",          "Вид",                   "View" },
    { "menu_zoom_in",       "Увеличить",             "Zoom in" },
    { "menu_zoom_out",      "Уменьшить",             "Zoom out" },
    { "menu_zoom_fit",      "По размеру окна",       "Fit to window" },
    { "menu_zoom_100",      "Масштаб 1:1",           "Actual size" },
    { "menu_settings",      "Настройки",             "Settings" },
    { "menu_units",         "Единица отображения",   "Display unit" },
    { "menu_language",      "Язык",                  "Language" },
    { "menu_help",          "Справка",               "Help" },
    { "menu_usage",         "Инструкция",            "Usage" },
    { "menu_licenses",      "Лицензии",              "Licenses" },
    { "menu_about",         "О программе",           "About" },

    { "help_text",
      "1. Откройте изображение (Ctrl+O).\n"
      "2. Калибровка: два клика по масштабной линейке, затем введите длину.\n"
      "3. Измерение: два клика по концам диаметра частицы.\n"
      "4. Ctrl+Z — отмена, Delete — удалить выбранные, Esc — отменить клик.\n"
      "5. Группы: растяните рамку вокруг частиц.\n"
      "6. Распределение и экспорт CSV — в меню Инструменты и Файл.\n"
      "Колесо мыши — масштаб, правая кнопка — перемещение.",
      "1. Open an image (Ctrl+O).\n"
      "2. Calibrate: two clicks on the scale bar, then enter its length.\n"
      "3. Measure: two clicks on the ends of a particle diameter.\n"
      "4. Ctrl+Z undo, Delete removes selected, Esc cancels a click.\n"
      "5. Groups: drag a rectangle around particles.\n"
      "6. Distribution and CSV export are in the Tools and File menus.\n"
      "Mouse wheel zooms, right button pans." },
    { "licenses_text",
      "Qt 6 — LGPLv3\nQt Charts — GPLv3\nEigen — MPL 2.0",
      "Qt 6 — LGPLv3\nQt Charts — GPLv3\nEigen — MPL 2.0" },
    { "about_text",
      "NanoSizer\nИзмерение диаметров наночастиц на ПЭМ/СЭМ изображениях.",
      "NanoSizer\nNanoparticle diameter measurement for TEM/SEM images." },

    // ——— Ошибки ядра ———
    { "err_invalid_scale",     "Длина и расстояние в пикселях должны быть положительными числами",
                               "Length and pixel distance must be positive numbers" },
    { "err_uncalibrated",      "Сначала задайте масштаб", "Please set the scale first" },
    { "err_nothing_to_undo",   "Нечего отменять",      "Nothing to undo" },
    { "err_not_found",         "Объект не найден",     "Item not found" },
    { "err_empty_group",       "Группа пуста",         "Group is empty" },
    { "err_insufficient_data", "Нужно минимум 2 значения", "At least 2 values are required" },
    { "err_degenerate",        "Все значения одинаковы", "All values are identical" },
    { "err_fit_failed",        "Аппроксимация Гаусса не сошлась", "Gaussian fit did not converge" },
};

const QHash<QByteArray, const Entry*>& table()
{
    static const QHash<QByteArray, const Entry*> hash = [] {
        QHash<QByteArray, const Entry*> h;
        for (const Entry& e : kEntries)
            h.insert(QByteArray(e.key), &e);
        return h;
    }();
    return hash;
}

} // namespace

void UiStrings::setLanguage(UiLanguage language)
{
    s_language = language;
}

UiLanguage UiStrings::language()
{
    return s_language;
}

QString UiStrings::text(const char* key)
{
    return text(key, s_language);
}

QString UiStrings::text(const char* key, UiLanguage language)
{
    const Entry* e = table().value(QByteArray(key), nullptr);
    if (!e)
        return QString::fromLatin1(key);
    return QString::fromUtf8(language == UiLanguage::Russian ? e->ru : e->en);
}

QString UiStrings::languageCode(UiLanguage language)
{
    return language == UiLanguage::Russian ? QStringLiteral("RU") : QStringLiteral("EN");
}
