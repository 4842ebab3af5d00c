#ifndef IDREDACT_PIPELINE_DEMO_CORPUS_HPP
#define IDREDACT_PIPELINE_DEMO_CORPUS_HPP

#include <string>
#include <vector>

/**
 * @file demo_corpus.hpp
 * @brief Sample texts for `idredact --demo`: one real identifier per
 *        supported document type, followed by ordinary numeric text and
 *        lookalikes that exercise the false-positive behavior of the catalog.
 */

namespace idredact {
namespace pipeline {

inline const std::vector<std::string> &demoIdentifierTexts()
{
    static const std::vector<std::string> texts = {
        "Mi RUT es 12.345.678-9",
        "CURP: GOML840512HDFRRN09",
        "RFC: GOM8405121A1",
        "Número cubano: CUB-123456-54321",
        "DPI guatemalteco: 1234 56789 1234",
        "ID Haití: 01-02-03-12345",
        "CI Bolivia: 12345678-LP",
        "CUIT: 20-12345678-1",
        "Número brasileño: 123.456.789-00",
        "Cédula Venezuela: V-12345678",
        "CI uruguaya: 1.234.567-8",
        "Pasaporte chileno: C-12345678",
        "Pasaporte mexicano: G-12345678",
        "Pasaporte argentino: AA-1234567",
        "Número salvadoreño: SV-1234-123456-123-1",
        "Número dominicano: RD-1-23-12345-6",
        "RTN Honduras: HN-1234-5678-12345",
        "RUC Panamá: P-123-456-789",
        "RUC Perú: PE-20123456789",
        "RUC Paraguay: 12345678A-9",
        "RUC Ecuador: EC-1790012345-001",
        "CI Nicaragua: 123-456789-1234A",
        "Número colombiano: COL-800123456-1",
    };
    return texts;
}

inline const std::vector<std::string> &demoLookalikeTexts()
{
    static const std::vector<std::string> texts = {
        "El precio es 10.000 pesos.",
        "Hoy es 12-05-2025, temperatura 22.5°C.",
        "La ecuación es: 5x² + 3x - 7 = 0",
        "Mi número de serie es 123456789",
        "La raíz de 64 es 8",
        "Esto no tiene nada",
        "Código de producto: A1B2C3D4E5",
        "Resultado de 2023/6 = 337.17",
        "Probabilidad: P(A ∩ B) = 0.5",
        "Suma de 7 + 8 + 9 = 24",
        "Transacción: 123-456-789",
        "Factura número 1234-5678",
        "Fecha de emisión: 10-10-2022",
        "Código interno: 01-02-3456",
        "Folio: 987654321-0",
        "Serial: 123456-789",
        "12-12-1212 es una fecha espeluznante",
        "Nota de débito 12345678-9",
        "Token ID: 1122-3344-5566",
        "Rango: 100-200-300",
        "Número cliente: 1234567",
        "Clave: 0102030405",
        "Código SII: 12.345.678-9",
        "Monto: 12000-2000",
        "Error 202-404-500",
        "Teléfono: 1234-5678",
        "Referencia: 1111-2222-3333",
        "Documento: 2023-05-17",
        "Identificador: 20-12345678-1",
        "Mi IP es 192.168.1.1",
        "Numero normal 1",
        "Numero normal 11",
        "Numero normal 222",
        "Numero normal 3333",
        "Numero normal 44444",
        "Numero normal 555555",
        "Numero normal 6666666",
        "Numero normal 77777777",
        "Numero normal 888888888",
        "Numero normal 9999999999",
        "Número de teléfono: +56 9 8765 4321",
    };
    return texts;
}

/// Identifier texts followed by lookalike texts.
inline std::vector<std::string> demoCorpus()
{
    std::vector<std::string> all = demoIdentifierTexts();
    const auto &lookalike = demoLookalikeTexts();
    all.insert(all.end(), lookalike.begin(), lookalike.end());
    return all;
}

} // namespace pipeline
} // namespace idredact

#endif // IDREDACT_PIPELINE_DEMO_CORPUS_HPP
